// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace codeproof::logging {
    log::log(log_level level, std::unique_ptr<std::ostream> out)
        : m_loglevel(level),
          m_sink(std::make_shared<sink>()) {
        m_sink->m_owned = std::move(out);
        m_sink->m_out
            = m_sink->m_owned ? m_sink->m_owned.get() : &std::cerr;
    }

    log::log(log_level level, std::shared_ptr<sink> s, std::string tag)
        : m_loglevel(level),
          m_sink(std::move(s)),
          m_tag(std::move(tag)) {}

    auto log::with_tag(const std::string& tag) const -> std::shared_ptr<log> {
        auto full_tag = m_tag.empty() ? tag : m_tag + "] [" + tag;
        return std::shared_ptr<log>(
            new log(m_loglevel, m_sink, std::move(full_tag)));
    }

    void log::set_loglevel(log_level level) {
        m_loglevel = level;
    }

    auto log::get_log_level() const -> log_level {
        return m_loglevel;
    }

    void log::flush() {
        const std::lock_guard<std::mutex> l(m_sink->m_mut);
        m_sink->m_out->flush();
    }

    void log::emit(const std::string& line) {
        const std::lock_guard<std::mutex> l(m_sink->m_mut);
        *m_sink->m_out << line;
    }

    auto log::prefix(log_level level) const -> std::string {
        auto now = std::chrono::system_clock::now();
        auto now_t = std::chrono::system_clock::to_time_t(now);
        static constexpr int msec_per_sec = 1000;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count()
                % msec_per_sec;
        auto tm = std::tm{};
        gmtime_r(&now_t, &tm);

        std::stringstream ss;
        ss << std::put_time(&tm, "[%Y-%m-%dT%H:%M:%S.") << std::setfill('0')
           << std::setw(3) << ms << "Z] [" << to_string(level) << "]";
        if(!m_tag.empty()) {
            ss << " [" << m_tag << "]";
        }
        return ss.str();
    }

    auto to_string(log_level level) -> std::string {
        switch(level) {
            case log_level::trace:
                return "TRACE";
            case log_level::debug:
                return "DEBUG";
            case log_level::info:
                return "INFO ";
            case log_level::warn:
                return "WARN ";
            case log_level::error:
                return "ERROR";
            case log_level::fatal:
                return "FATAL";
        }
        return "NONE ";
    }

    auto parse_loglevel(const std::string& level) -> std::optional<log_level> {
        static const auto names = std::array<std::pair<const char*, log_level>,
                                             6>{{{"TRACE", log_level::trace},
                                                 {"DEBUG", log_level::debug},
                                                 {"INFO", log_level::info},
                                                 {"WARN", log_level::warn},
                                                 {"ERROR", log_level::error},
                                                 {"FATAL", log_level::fatal}}};
        for(const auto& [name, lvl] : names) {
            if(level == name) {
                return lvl;
            }
        }
        return std::nullopt;
    }
}
