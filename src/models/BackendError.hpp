#ifndef BACKENDERROR_HPP
#define BACKENDERROR_HPP

#include <stdexcept>
#include <string>

// Failure of a backend fetch. Travels through the cache as the producer error
// and is mapped to a client status by the facade.
class BackendError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        UpstreamServerError,
        UnexpectedStatus,
        Unreachable,
        CircuitOpen
    };

    BackendError(Kind kind, const std::string& message, unsigned upstream_status = 0)
        : std::runtime_error(message), kind_(kind), upstream_status_(upstream_status) {}

    Kind kind() const { return kind_; }
    unsigned upstreamStatus() const { return upstream_status_; }

private:
    Kind kind_;
    unsigned upstream_status_;
};

#endif // BACKENDERROR_HPP
