#pragma once

#include <string>
#include <exception>

namespace ndl {

    // FatalError: the image or the engine is corrupt (bad tag, bad address, unbalanced scope).
    // The instance that threw must be discarded.
    class FatalError: public std::exception {
    public:
        FatalError();
        char const* what() const noexcept override { return "needle: fatal error (see above error messages)"; }
    };

    // ResourceExhaustedError: a host-enforced limit was hit.
    // Raised inside the heap and stack, converted into a RunResult by the VM.
    class ResourceExhaustedError: public std::exception {
    private:
        std::string m_msg;
    public:
        explicit ResourceExhaustedError(std::string msg)
        :   m_msg(std::move(msg))
        {}
        char const* what() const noexcept override { return m_msg.c_str(); }
        std::string const& message() const { return m_msg; }
    };

    void error(std::string msg);
    void warning(std::string msg);
    void info(std::string msg);
    void more(std::string msg);

}   // namespace ndl
