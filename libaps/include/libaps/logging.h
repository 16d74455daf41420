//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <iostream>
#include <string>
#include <source_location> // C++20, but essential for good logging

namespace aps::log {

    // A logging handle that is passed around explicitly instead of living in
    // process-wide state. Copies share the same output stream.
    class Logger {
    public:
        explicit Logger(std::ostream& out = std::cout, bool verbose = false, bool color = true)
            : m_out(&out), m_verbose(verbose), m_color(color) {}

        void ok(const std::string& msg) const {
            print("OKY", "\033[1;32m", msg); // Bold Green
        }

        void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) const {
            std::string full_msg = msg;
            if (m_verbose) {
                full_msg += " (at " + std::string(loc.file_name()) + ":" + std::to_string(loc.line()) + ")";
            }
            print("ERR", "\033[1;31m", full_msg); // Bold Red
        }

        void info(const std::string& msg) const {
            print("LOG", "\033[1;34m", msg); // Bold Blue
        }

        void warn(const std::string& msg) const {
            print("WRN", "\033[1;33m", msg); // Bold Yellow
        }

        // Only printed when the logger is verbose.
        void debug(const std::string& msg) const {
            if (m_verbose) {
                print("DBG", "\033[0;36m", msg); // Cyan
            }
        }

        bool verbose() const { return m_verbose; }
        void set_verbose(bool verbose) { m_verbose = verbose; }
        void set_color(bool color) { m_color = color; }

    private:
        // Helper function to format the output consistently
        void print(const std::string& level, const std::string& color_code, const std::string& msg) const {
            if (m_color) {
                *m_out << color_code << "[  " << level << "  ] > " << "\033[0m" << msg << std::endl;
            } else {
                *m_out << "[  " << level << "  ] > " << msg << std::endl;
            }
        }

        std::ostream* m_out;
        bool m_verbose;
        bool m_color;
    };

} // namespace aps::log
