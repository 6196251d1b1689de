#ifndef BIKEFIT_COMMON_ERRORS_HPP
#define BIKEFIT_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bikefit {

// An input combination that has no real frame geometry, or a required
// field that is missing or not a number. Fatal for the layout being computed.
class DomainError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The input source itself could not be read or parsed
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace bikefit

#endif // BIKEFIT_COMMON_ERRORS_HPP
