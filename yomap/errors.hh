// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <stdexcept>
#include <string>

namespace yomap {

  // Every failure raised while mapping between records and configuration
  // nodes is reported with this type. Messages carry the node path when one
  // is known, e.g., "root.sections[0].id: Value not a UUID: xyz". Parse
  // failures of scalar literals are attached as nested exceptions.
  class SerializationError : public std::runtime_error {
  public:
    explicit SerializationError( const std::string& msg )
      : std::runtime_error( msg ) {}
  };

} // namespace yomap
