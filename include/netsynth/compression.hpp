/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "compression.h"
#include "definitions.h"
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace netsynth {

namespace detail {

    inline void checkLz4(size_t code, const char* operation) {
        if (LZ4F_isError(code)) {
            throw std::runtime_error(std::string("LZ4 ") + operation + " failed: " + LZ4F_getErrorName(code));
        }
    }

} // namespace detail

// Compressor class implementation
inline Compressor::Compressor(int compressionLevel) {
    std::memset(&prefs_, 0, sizeof(prefs_));
    prefs_.compressionLevel = compressionLevel;
    prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
    detail::checkLz4(LZ4F_createCompressionContext(&cctx_, LZ4F_VERSION), "context creation");
}

inline Compressor::~Compressor() { 
    LZ4F_freeCompressionContext(cctx_);
}

inline std::vector<char> Compressor::compress(std::span<const char> src)
{
    std::vector<char> dst;
    beginCompression(dst);
    compressUpdate(dst, src);
    endCompression(dst);
    return dst;
}

inline void Compressor::beginCompression(std::vector<char>& dst)
{
    /* Begin compression and write frame header */
    const size_t offset = dst.size();
    dst.resize(offset + LZ4F_HEADER_SIZE_MAX);
    size_t written = LZ4F_compressBegin(cctx_, dst.data() + offset, LZ4F_HEADER_SIZE_MAX, &prefs_);
    detail::checkLz4(written, "frame begin");
    dst.resize(offset + written);
}

inline void Compressor::compressUpdate(std::vector<char>& dst, std::span<const char> src)
{
    if (src.empty()) {
        return;
    }
    const size_t offset = dst.size();
    const size_t bound = LZ4F_compressBound(src.size(), &prefs_);
    dst.resize(offset + bound);
    size_t written = LZ4F_compressUpdate(cctx_, dst.data() + offset, bound,
                                         src.data(), src.size(), nullptr);
    detail::checkLz4(written, "compress update");
    dst.resize(offset + written);
}

inline void Compressor::endCompression(std::vector<char>& dst)
{
    /* Flush buffered input and write frame footer (end mark + content checksum) */
    const size_t offset = dst.size();
    const size_t bound = LZ4F_compressBound(0, &prefs_);
    dst.resize(offset + bound);
    size_t written = LZ4F_compressEnd(cctx_, dst.data() + offset, bound, nullptr);
    detail::checkLz4(written, "frame end");
    dst.resize(offset + written);
}

inline size_t Compressor::getMaxCompressedSize(size_t srcSize)
{
    /* Calculate maximum possible compressed size including frame overhead */
    return LZ4F_compressFrameBound(srcSize, nullptr);
}

// DeCompressor class implementation
inline DeCompressor::DeCompressor() { 
    detail::checkLz4(LZ4F_createDecompressionContext(&dctx_, LZ4F_VERSION), "context creation");
}

inline DeCompressor::~DeCompressor() { 
    LZ4F_freeDecompressionContext(dctx_); 
}

inline std::vector<char> DeCompressor::decompress(std::span<const char> src)
{
    std::vector<char> dst;
    std::vector<char> chunk(LZ4_BLOCK_SIZE_KB * 1024);
    const char* in = src.data();
    size_t remaining = src.size();

    // Concatenated frames decode back to back; bytes that do not start a frame are an error
    do {
        resetDecompression();
        decodeFrame(in, remaining, dst, chunk);
    } while (remaining > 0);
    return dst;
}

inline void DeCompressor::decodeFrame(const char*& in, size_t& remaining,
                                      std::vector<char>& dst, std::vector<char>& chunk)
{
    size_t hint = 1;

    while (remaining > 0 && hint != 0) {
        size_t dstSize = chunk.size();
        size_t srcSize = remaining;
        hint = LZ4F_decompress(dctx_, chunk.data(), &dstSize, in, &srcSize, nullptr);
        detail::checkLz4(hint, "decompress");
        dst.insert(dst.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(dstSize));
        in += srcSize;
        remaining -= srcSize;
        if (srcSize == 0 && dstSize == 0) {
            break;
        }
    }

    // Drain output still held in the context
    while (hint != 0) {
        size_t dstSize = chunk.size();
        size_t srcSize = 0;
        hint = LZ4F_decompress(dctx_, chunk.data(), &dstSize, in, &srcSize, nullptr);
        detail::checkLz4(hint, "decompress");
        if (dstSize == 0) {
            break;
        }
        dst.insert(dst.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(dstSize));
    }

    if (hint != 0) {
        throw std::runtime_error("LZ4 decompress failed: truncated frame");
    }
}

inline void DeCompressor::resetDecompression()
{
    LZ4F_resetDecompressionContext(dctx_);
}

inline bool isLz4Frame(std::span<const char> head)
{
    if (head.size() < 4) {
        return false;
    }
    // frame magic 0x184D2204, stored little-endian
    const auto* b = reinterpret_cast<const unsigned char*>(head.data());
    const uint32_t magic = static_cast<uint32_t>(b[0])
                         | (static_cast<uint32_t>(b[1]) << 8)
                         | (static_cast<uint32_t>(b[2]) << 16)
                         | (static_cast<uint32_t>(b[3]) << 24);
    return magic == 0x184D2204U;
}

} // namespace netsynth
