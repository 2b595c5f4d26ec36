// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "normalizer.hpp"

namespace codeproof::bytecode {
    namespace {
        constexpr auto major_shift = 5;
        constexpr uint8_t info_mask = 0x1f;
        constexpr uint8_t major_map = 5;
        constexpr size_t max_depth = 16;

        // Reads the argument of an item head whose initial byte has already
        // been consumed. Indefinite lengths and reserved values fail.
        auto read_argument(const buffer& buf,
                           size_t& pos,
                           size_t end,
                           uint8_t info) -> std::optional<uint64_t> {
            static constexpr uint8_t one_byte = 24;
            static constexpr uint8_t eight_bytes = 27;
            static constexpr auto byte_bits = 8;
            if(info < one_byte) {
                return info;
            }
            if(info > eight_bytes) {
                return std::nullopt;
            }
            auto width = size_t{1} << (info - one_byte);
            if(width > end - pos) {
                return std::nullopt;
            }
            auto ret = uint64_t{};
            for(size_t i = 0; i < width; i++) {
                ret = (ret << byte_bits) | buf.byte_at(pos + i);
            }
            pos += width;
            return ret;
        }

        // Advances pos past one well-formed CBOR item ending at or before
        // end.
        auto skip_item(const buffer& buf, size_t& pos, size_t end, size_t depth)
            -> bool {
            if(pos >= end || depth > max_depth) {
                return false;
            }
            auto head = buf.byte_at(pos++);
            auto major = head >> major_shift;
            auto info = static_cast<uint8_t>(head & info_mask);
            auto arg = read_argument(buf, pos, end, info);
            if(!arg.has_value()) {
                return false;
            }
            switch(major) {
                case 0:
                case 1:
                case 7:
                    return true;
                case 2:
                case 3:
                    if(arg.value() > end - pos) {
                        return false;
                    }
                    pos += arg.value();
                    return true;
                case 4:
                case 5: {
                    auto items = arg.value();
                    if(major == major_map) {
                        if(items > (end - pos) / 2) {
                            return false;
                        }
                        items *= 2;
                    }
                    if(items > end - pos) {
                        return false;
                    }
                    for(uint64_t i = 0; i < items; i++) {
                        if(!skip_item(buf, pos, end, depth + 1)) {
                            return false;
                        }
                    }
                    return true;
                }
                case 6:
                    return skip_item(buf, pos, end, depth + 1);
                default:
                    return false;
            }
        }

        // Start of a metadata trailer ending at end: a 2-byte length L
        // preceded by exactly L bytes that decode as one CBOR map.
        auto trailer_start(const buffer& code, size_t end)
            -> std::optional<size_t> {
            static constexpr size_t len_size = 2;
            static constexpr auto byte_bits = 8;
            if(end <= len_size) {
                return std::nullopt;
            }
            auto hi = code.byte_at(end - 2);
            auto lo = code.byte_at(end - 1);
            auto cbor_len = static_cast<size_t>((hi << byte_bits) | lo);
            if(cbor_len == 0 || cbor_len > end - len_size) {
                return std::nullopt;
            }
            auto start = end - len_size - cbor_len;
            if((code.byte_at(start) >> major_shift) != major_map) {
                return std::nullopt;
            }
            auto pos = start;
            if(!skip_item(code, pos, end - len_size, 0)
               || pos != end - len_size) {
                return std::nullopt;
            }
            return start;
        }
    }

    auto to_string(normalization_error err) -> std::string {
        switch(err) {
            case normalization_error::range_out_of_bounds:
                return "range_out_of_bounds";
        }
        return "unknown";
    }

    auto immutable_range::operator==(const immutable_range& rhs) const
        -> bool {
        return m_offset == rhs.m_offset && m_length == rhs.m_length;
    }

    auto strip_metadata(const buffer& code) -> split_code {
        auto core_len = code.size();
        while(auto start = trailer_start(code, core_len)) {
            core_len = start.value();
        }
        auto ret = split_code{};
        ret.m_core = code.slice(0, core_len);
        ret.m_trailer = code.slice_from(core_len);
        return ret;
    }

    auto mask_immutables(const buffer& code, const immutable_map& immutables)
        -> std::variant<buffer, normalization_error> {
        auto ret = code;
        for(const auto& [id, ranges] : immutables) {
            for(const auto& r : ranges) {
                if(r.m_offset > ret.size()
                   || r.m_length > ret.size() - r.m_offset) {
                    return normalization_error::range_out_of_bounds;
                }
                ret.zero(r.m_offset, r.m_length);
            }
        }
        return ret;
    }

    auto split_constructor_args(const buffer& input, size_t compiled_len)
        -> std::optional<split_input> {
        if(input.size() < compiled_len) {
            return std::nullopt;
        }
        return split_input{input.slice(0, compiled_len),
                           input.slice_from(compiled_len)};
    }
}
