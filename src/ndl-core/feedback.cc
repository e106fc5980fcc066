#include "ndl-core/feedback.hh"

#include <iostream>

namespace ndl {

    FatalError::FatalError() {
        std::cout << "FATAL-ERROR: see above error messages." << std::endl;
    }

    static void help_fb_print(char const* prefix, std::string const& msg) {
        std::cout << prefix;
        for (char const c: msg) {
            std::cout << c;
            if (c == '\n') {
                std::cout << "       ";
            }
        }
        std::cout << std::endl;
    }
    void error(std::string msg)     { help_fb_print("ERROR: ", msg); }
    void warning(std::string msg)   { help_fb_print("WARN:  ", msg); }
    void info(std::string msg)      { help_fb_print("INFO:  ", msg); }
    void more(std::string msg)      { help_fb_print("       ", msg); }

}   // namespace ndl
