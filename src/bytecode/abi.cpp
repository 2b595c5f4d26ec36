// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi.hpp"

#include "util/common/hash.hpp"

#include <cstring>
#include <limits>

namespace codeproof::bytecode {
    namespace {
        constexpr size_t max_nesting = 16;
        constexpr size_t max_fixed_array = 1U << 16U;
        constexpr size_t bits_per_byte = 8;

        auto is_number(const std::string& s) -> bool {
            return !s.empty()
                && s.find_first_not_of("0123456789") == std::string::npos;
        }

        /// Reads the width suffix of a sized type, such as the 160 in
        /// uint160. An empty suffix yields the default.
        auto type_width(const std::string& type,
                        size_t prefix_len,
                        size_t default_width) -> std::optional<size_t> {
            auto suffix = type.substr(prefix_len);
            if(suffix.empty()) {
                return default_width;
            }
            if(!is_number(suffix) || suffix.size() > 3) {
                return std::nullopt;
            }
            return static_cast<size_t>(std::stoul(suffix));
        }

        /// Array type split into its element and length.
        struct array_info {
            abi_param m_element;
            /// std::nullopt for a dynamic array.
            std::optional<size_t> m_length;
        };

        auto as_array(const abi_param& p) -> std::optional<array_info> {
            if(p.m_type.empty() || p.m_type.back() != ']') {
                return std::nullopt;
            }
            auto open = p.m_type.rfind('[');
            if(open == std::string::npos) {
                return std::nullopt;
            }
            auto ret = array_info{};
            ret.m_element.m_type = p.m_type.substr(0, open);
            ret.m_element.m_components = p.m_components;
            auto dim = p.m_type.substr(open + 1,
                                       p.m_type.size() - open - 2);
            if(!dim.empty()) {
                if(!is_number(dim) || dim.size() > 6) {
                    return std::nullopt;
                }
                ret.m_length = static_cast<size_t>(std::stoul(dim));
            }
            return ret;
        }

        auto is_tuple(const abi_param& p) -> bool {
            return p.m_type == "tuple";
        }

        auto is_dynamic(const abi_param& p) -> bool {
            if(auto arr = as_array(p)) {
                return !arr->m_length.has_value() || is_dynamic(arr->m_element);
            }
            if(p.m_type == "bytes" || p.m_type == "string") {
                return true;
            }
            if(is_tuple(p)) {
                for(const auto& c : p.m_components) {
                    if(is_dynamic(c)) {
                        return true;
                    }
                }
            }
            return false;
        }

        /// Number of head words taken by a static type.
        auto static_words(const abi_param& p) -> std::optional<size_t> {
            if(auto arr = as_array(p)) {
                auto elem = static_words(arr->m_element);
                if(!elem.has_value() || arr->m_length.value() > max_fixed_array
                   || elem.value() > max_fixed_array) {
                    return std::nullopt;
                }
                return elem.value() * arr->m_length.value();
            }
            if(is_tuple(p)) {
                size_t total{0};
                for(const auto& c : p.m_components) {
                    auto w = is_dynamic(c) ? std::optional<size_t>(1)
                                           : static_words(c);
                    if(!w.has_value() || w.value() > max_fixed_array) {
                        return std::nullopt;
                    }
                    total += w.value();
                }
                return total;
            }
            return 1;
        }

        /// Walks an ABI encoding, checking structure against types.
        class abi_checker {
          public:
            explicit abi_checker(const buffer& data) : m_data(data) {}

            auto check_items(const std::vector<const abi_param*>& items,
                             size_t start,
                             size_t depth) -> std::optional<std::string> {
                if(depth > max_nesting) {
                    return "nesting too deep";
                }
                auto pos = start;
                for(const auto* item : items) {
                    if(is_dynamic(*item)) {
                        auto offset = read_size(pos);
                        if(!offset.has_value()) {
                            return "offset for " + item->m_type
                                 + " out of range at byte "
                                 + std::to_string(pos);
                        }
                        if(offset.value() > m_data.size() - start) {
                            return "offset for " + item->m_type
                                 + " points past the end";
                        }
                        auto err = check_dynamic(*item,
                                                 start + offset.value(),
                                                 depth + 1);
                        if(err.has_value()) {
                            return err;
                        }
                        pos += abi_word_size;
                    } else {
                        auto words = static_words(*item);
                        if(!words.has_value()) {
                            return "unsupported type " + item->m_type;
                        }
                        auto err = check_static(*item, pos, depth + 1);
                        if(err.has_value()) {
                            return err;
                        }
                        pos += words.value() * abi_word_size;
                    }
                }
                return std::nullopt;
            }

          private:
            const buffer& m_data;

            [[nodiscard]] auto has_word(size_t pos) const -> bool {
                return pos <= m_data.size()
                    && m_data.size() - pos >= abi_word_size;
            }

            /// Reads a word that must fit in size_t.
            [[nodiscard]] auto read_size(size_t pos) const
                -> std::optional<size_t> {
                if(!has_word(pos)) {
                    return std::nullopt;
                }
                constexpr auto value_bytes = sizeof(uint64_t);
                for(size_t i = 0; i < abi_word_size - value_bytes; i++) {
                    if(m_data.byte_at(pos + i) != 0) {
                        return std::nullopt;
                    }
                }
                uint64_t val{0};
                for(size_t i = abi_word_size - value_bytes; i < abi_word_size;
                    i++) {
                    val = (val << bits_per_byte) | m_data.byte_at(pos + i);
                }
                if(val > std::numeric_limits<size_t>::max()) {
                    return std::nullopt;
                }
                return static_cast<size_t>(val);
            }

            [[nodiscard]] auto zero_range(size_t pos, size_t from, size_t to)
                const -> bool {
                for(auto i = from; i < to; i++) {
                    if(m_data.byte_at(pos + i) != 0) {
                        return false;
                    }
                }
                return true;
            }

            auto check_sequence(const abi_param& element,
                                size_t count,
                                size_t start,
                                size_t depth) -> std::optional<std::string> {
                auto items = std::vector<const abi_param*>(count, &element);
                return check_items(items, start, depth);
            }

            auto check_dynamic(const abi_param& p, size_t pos, size_t depth)
                -> std::optional<std::string> {
                if(p.m_type == "bytes" || p.m_type == "string") {
                    auto len = read_size(pos);
                    if(!len.has_value()) {
                        return "length of " + p.m_type + " out of range";
                    }
                    auto padded = (len.value() + abi_word_size - 1)
                                / abi_word_size * abi_word_size;
                    if(len.value() > m_data.size()
                       || padded > m_data.size() - pos - abi_word_size) {
                        return p.m_type + " data runs past the end";
                    }
                    return std::nullopt;
                }
                if(auto arr = as_array(p)) {
                    if(arr->m_length.has_value()) {
                        return check_sequence(arr->m_element,
                                              arr->m_length.value(),
                                              pos,
                                              depth);
                    }
                    auto count = read_size(pos);
                    if(!count.has_value()) {
                        return "length of " + p.m_type + " out of range";
                    }
                    auto avail = (m_data.size() - pos - abi_word_size)
                               / abi_word_size;
                    if(count.value() > avail) {
                        return p.m_type + " length exceeds the data";
                    }
                    return check_sequence(arr->m_element,
                                          count.value(),
                                          pos + abi_word_size,
                                          depth);
                }
                auto items = std::vector<const abi_param*>();
                for(const auto& c : p.m_components) {
                    items.push_back(&c);
                }
                return check_items(items, pos, depth);
            }

            auto check_static(const abi_param& p, size_t pos, size_t depth)
                -> std::optional<std::string> {
                if(as_array(p).has_value() || is_tuple(p)) {
                    return check_dynamic(p, pos, depth);
                }
                if(!has_word(pos)) {
                    return p.m_type + " at byte " + std::to_string(pos)
                         + " runs past the end";
                }
                auto bad_word = [&]() {
                    return "invalid " + p.m_type + " value at byte "
                         + std::to_string(pos);
                };
                const auto& t = p.m_type;
                if(t == "address") {
                    constexpr size_t address_pad = 12;
                    return zero_range(pos, 0, address_pad)
                             ? std::nullopt
                             : std::optional<std::string>(bad_word());
                }
                if(t == "bool") {
                    auto last = m_data.byte_at(pos + abi_word_size - 1);
                    return zero_range(pos, 0, abi_word_size - 1) && last <= 1
                             ? std::nullopt
                             : std::optional<std::string>(bad_word());
                }
                if(t == "function") {
                    constexpr size_t function_size = 24;
                    return zero_range(pos, function_size, abi_word_size)
                             ? std::nullopt
                             : std::optional<std::string>(bad_word());
                }
                if(t.rfind("uint", 0) == 0) {
                    auto bits = type_width(t, 4, 256);
                    if(!bits || bits.value() == 0
                       || bits.value() % bits_per_byte != 0
                       || bits.value() > abi_word_size * bits_per_byte) {
                        return "unsupported type " + t;
                    }
                    auto pad = abi_word_size - bits.value() / bits_per_byte;
                    return zero_range(pos, 0, pad)
                             ? std::nullopt
                             : std::optional<std::string>(bad_word());
                }
                if(t.rfind("int", 0) == 0) {
                    auto bits = type_width(t, 3, 256);
                    if(!bits || bits.value() == 0
                       || bits.value() % bits_per_byte != 0
                       || bits.value() > abi_word_size * bits_per_byte) {
                        return "unsupported type " + t;
                    }
                    auto pad = abi_word_size - bits.value() / bits_per_byte;
                    if(pad == 0) {
                        return std::nullopt;
                    }
                    constexpr uint8_t sign_bit = 0x80;
                    auto negative = (m_data.byte_at(pos + pad) & sign_bit) != 0;
                    uint8_t fill = negative ? 0xff : 0x00;
                    for(size_t i = 0; i < pad; i++) {
                        if(m_data.byte_at(pos + i) != fill) {
                            return bad_word();
                        }
                    }
                    return std::nullopt;
                }
                if(t.rfind("bytes", 0) == 0) {
                    auto n = type_width(t, 5, 0);
                    if(!n || n.value() == 0 || n.value() > abi_word_size) {
                        return "unsupported type " + t;
                    }
                    return zero_range(pos, n.value(), abi_word_size)
                             ? std::nullopt
                             : std::optional<std::string>(bad_word());
                }
                if(t.rfind("fixed", 0) == 0 || t.rfind("ufixed", 0) == 0) {
                    return std::nullopt;
                }
                return "unsupported type " + t;
            }
        };
    }

    auto parse_params(const Json::Value& inputs)
        -> std::optional<std::vector<abi_param>> {
        if(!inputs.isArray()) {
            return std::nullopt;
        }
        auto ret = std::vector<abi_param>();
        for(const auto& in : inputs) {
            if(!in.isObject() || !in["type"].isString()) {
                return std::nullopt;
            }
            auto p = abi_param{in["type"].asString(), {}};
            if(in.isMember("components")) {
                auto comps = parse_params(in["components"]);
                if(!comps.has_value()) {
                    return std::nullopt;
                }
                p.m_components = std::move(comps.value());
            }
            ret.emplace_back(std::move(p));
        }
        return ret;
    }

    auto constructor_inputs(const Json::Value& abi)
        -> std::optional<std::vector<abi_param>> {
        if(!abi.isArray()) {
            return std::nullopt;
        }
        for(const auto& entry : abi) {
            if(entry.isObject() && entry["type"].asString() == "constructor") {
                if(!entry.isMember("inputs")) {
                    return std::vector<abi_param>();
                }
                return parse_params(entry["inputs"]);
            }
        }
        return std::vector<abi_param>();
    }

    auto canonical_type(const abi_param& param) -> std::string {
        constexpr auto tuple_len = 5;
        if(param.m_type.rfind("tuple", 0) != 0) {
            return param.m_type;
        }
        auto ret = std::string("(");
        for(size_t i = 0; i < param.m_components.size(); i++) {
            if(i > 0) {
                ret += ",";
            }
            ret += canonical_type(param.m_components[i]);
        }
        ret += ")";
        ret += param.m_type.substr(tuple_len);
        return ret;
    }

    auto function_signature(const Json::Value& entry)
        -> std::optional<std::string> {
        if(!entry.isObject() || entry["type"].asString() != "function"
           || !entry["name"].isString()) {
            return std::nullopt;
        }
        auto params = entry.isMember("inputs")
                        ? parse_params(entry["inputs"])
                        : std::vector<abi_param>();
        if(!params.has_value()) {
            return std::nullopt;
        }
        auto sig = entry["name"].asString() + "(";
        for(size_t i = 0; i < params->size(); i++) {
            if(i > 0) {
                sig += ",";
            }
            sig += canonical_type((*params)[i]);
        }
        sig += ")";
        return sig;
    }

    auto function_selector(const std::string& signature) -> selector_t {
        auto h = keccak_data(signature.data(), signature.size());
        auto ret = selector_t();
        std::memcpy(ret.data(), h.data(), ret.size());
        return ret;
    }

    auto functions_by_selector(const Json::Value& abi)
        -> std::map<selector_t, Json::Value> {
        auto ret = std::map<selector_t, Json::Value>();
        if(!abi.isArray()) {
            return ret;
        }
        for(const auto& entry : abi) {
            auto sig = function_signature(entry);
            if(sig.has_value()) {
                ret.emplace(function_selector(sig.value()), entry);
            }
        }
        return ret;
    }

    auto to_string(const selector_t& selector) -> std::string {
        return "0x" + buffer(selector.data(), selector.size()).to_hex();
    }

    auto validate_abi_encoding(const buffer& args,
                               const std::optional<std::vector<abi_param>>&
                                   params) -> std::optional<std::string> {
        if(args.size() % abi_word_size != 0) {
            return "constructor arguments are not a whole number of 32-byte "
                   "words ("
                 + std::to_string(args.size()) + " bytes)";
        }
        if(!params.has_value()) {
            return std::nullopt;
        }
        if(params->empty()) {
            if(args.empty()) {
                return std::nullopt;
            }
            return "constructor takes no arguments but "
                 + std::to_string(args.size()) + " bytes follow the code";
        }
        if(args.empty()) {
            return "missing constructor arguments";
        }

        auto items = std::vector<const abi_param*>();
        for(const auto& p : params.value()) {
            items.push_back(&p);
        }
        auto checker = abi_checker(args);
        auto err = checker.check_items(items, 0, 0);
        if(err.has_value()) {
            return "malformed constructor arguments: " + err.value();
        }
        return std::nullopt;
    }
}
