#ifndef Ctess_TESS_EXCEPTION_HPP
#define Ctess_TESS_EXCEPTION_HPP

#include <string>
#include <exception>

namespace Ctess {

// Internal-consistency failure: a triangle walk that does not converge, a
// natural-neighbor boundary that does not close, or a grid whose adjacency
// is broken. Signals a corrupt grid or a bug, never bad caller input, which
// is reported with std::out_of_range / std::invalid_argument instead.
class GeometryException : public std::exception
{
    public:
        explicit GeometryException(const std::string& message)
            : m_message(message), m_what("\n\nERROR: " + message + "\n\n") {}
        virtual ~GeometryException() noexcept {}
        const std::string& report() const { return m_message; }
        virtual const char* what() const noexcept { return m_what.c_str(); }
    protected:
        std::string m_message;
    private:
        std::string m_what;
};

} // namespace Ctess

#endif // Ctess_TESS_EXCEPTION_HPP
