#ifndef BASE_EVENT_READER_HPP
#define BASE_EVENT_READER_HPP

#include "core/event_parser.hpp"

class IEventReader {
public:
  virtual ~IEventReader() = default;

  // Reads the whole source in one batch. Implementations throw SchemaError
  // when the source cannot be used at all.
  virtual ParseResult read_all() = 0;
};

#endif // BASE_EVENT_READER_HPP
