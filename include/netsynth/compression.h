/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include <cstddef>
#include <span>
#include <vector>
#include <lz4frame.h>

namespace netsynth {

    /**
     * LZ4 frame compression context. Output is a standard LZ4 frame
     * (readable by `lz4 -d`).
     */
    class Compressor
    {
    public: 
        explicit Compressor(int compressionLevel = 0);
        ~Compressor();

        Compressor(const Compressor&) = delete;
        Compressor& operator=(const Compressor&) = delete;

        // One-shot frame compression
        std::vector<char> compress(std::span<const char> src);

        // Streaming compression: append the encoded bytes to dst
        void beginCompression(std::vector<char>& dst);
        void compressUpdate(std::vector<char>& dst, std::span<const char> src);
        void endCompression(std::vector<char>& dst);

        static size_t getMaxCompressedSize(size_t srcSize);

    private:
        LZ4F_cctx*          cctx_ = nullptr;
        LZ4F_preferences_t  prefs_;
    };

    class DeCompressor
    {
    public: 
        DeCompressor();
        ~DeCompressor();

        DeCompressor(const DeCompressor&) = delete;
        DeCompressor& operator=(const DeCompressor&) = delete;

        /// Decode one or more concatenated frames. Throws std::runtime_error on
        /// corrupt or truncated input, including trailing bytes that are not a frame.
        std::vector<char> decompress(std::span<const char> src);

        void resetDecompression();

    private:
        void decodeFrame(const char*& in, size_t& remaining,
                         std::vector<char>& dst, std::vector<char>& chunk);

        LZ4F_dctx*          dctx_ = nullptr;
    };

    /// True if the first bytes carry the LZ4 frame magic number.
    bool isLz4Frame(std::span<const char> head);

} // namespace netsynth
