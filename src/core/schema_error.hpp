#ifndef SCHEMA_ERROR_HPP
#define SCHEMA_ERROR_HPP

#include <stdexcept>
#include <string>

// Fatal input problem: unreadable source, missing required column, or no
// usable rows. Aborts the run before any computation.
class SchemaError : public std::runtime_error {
public:
  explicit SchemaError(const std::string &message)
      : std::runtime_error(message) {}
};

#endif // SCHEMA_ERROR_HPP
