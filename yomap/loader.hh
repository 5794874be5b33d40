// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cctype>
#include <cstddef>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "yomap/node.hh"
#include "yomap/serializers.hh"

namespace yomap {

  // Reads YAML text into a ConfigNode document and writes documents back
  // out as YAML
  class YamlLoader {
  public:
    explicit YamlLoader( ConfigurationOptions options
      = ConfigurationOptions::defaults() )
      : options_( std::move(options) ) {}

    const ConfigurationOptions& options() const { return options_; }

    // An empty or null document yields a virtual root
    ConfigNode load( std::istream& in ) const;
    ConfigNode load( const std::string& text ) const;

    // Value of node as YAML text (empty for a virtual node)
    static std::string to_string( const ConfigNode& node );
    static void save( const ConfigNode& node, std::ostream& out );

  private:
    ConfigurationOptions options_;
  };

namespace internal {

  // Block YAML writer that places each stored comment on "# " lines above
  // its entry. Scalar text comes from the fkYAML serializer.

  inline bool has_block_children( const ConfigNode& node ) {
    if ( node.has_map_children() ) return !node.map_children().empty();
    if ( node.has_list_children() ) return !node.list_children().empty();
    return false;
  }

  inline std::string key_text( const ordered_node& key ) {
    const std::string s = to_string_any( key );
    bool plain = !s.empty();
    for ( char c : s ) {
      if ( !std::isalnum(static_cast< unsigned char >(c)) && c != '_'
        && c != '-' && c != '.' && c != '/' )
      {
        plain = false;
        break;
      }
    }
    if ( plain ) return s;

    std::string quoted = "\"";
    for ( char c : s ) {
      if ( c == '"' || c == '\\' ) quoted += '\\';
      quoted += c;
    }
    return quoted + '"';
  }

  // Value that fits after "key:" or "-" on one line
  inline std::string inline_text( const ordered_node& value ) {
    if ( value.is_mapping() ) return "{}";
    if ( value.is_sequence() ) return "[]";

    // fkYAML writes a one-element sequence as "- <scalar>\n"
    std::string s = ordered_node::serialize(
      ordered_node::sequence(ordered_node::sequence_type{ value }) );
    if ( s.compare(0, 2, "- ") == 0 ) s.erase( 0, 2 );
    while ( !s.empty() && s.back() == '\n' ) s.pop_back();
    return s;
  }

  inline void emit_comment( const ConfigNode& node, const std::string& pad,
    std::ostream& out )
  {
    std::optional< std::string > text = node.comment();
    if ( !text ) return;
    std::istringstream lines( *text );
    std::string line;
    while ( std::getline(lines, line) ) {
      out << pad << '#';
      if ( !line.empty() ) out << ' ' << line;
      out << '\n';
    }
  }

  inline void emit_block( const ConfigNode& node, std::size_t indent,
    std::ostream& out );

  inline void emit_entry( const ConfigNode& child, std::size_t indent,
    std::ostream& out )
  {
    if ( has_block_children(child) ) {
      out << '\n';
      emit_block( child, indent + 2, out );
    }
    else {
      out << ' ' << inline_text( child.value() ) << '\n';
    }
  }

  inline void emit_block( const ConfigNode& node, std::size_t indent,
    std::ostream& out )
  {
    const std::string pad( indent, ' ' );
    if ( node.has_map_children() ) {
      for ( const auto& [key, child] : node.map_children() ) {
        emit_comment( child, pad, out );
        out << pad << key_text( key ) << ':';
        emit_entry( child, indent, out );
      }
    }
    else {
      for ( const ConfigNode& child : node.list_children() ) {
        emit_comment( child, pad, out );
        out << pad << '-';
        emit_entry( child, indent, out );
      }
    }
  }

} // namespace yomap::internal

} // namespace yomap

inline yomap::ConfigNode yomap::YamlLoader::load( std::istream& in ) const {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->load( ss.str() );
}

inline yomap::ConfigNode yomap::YamlLoader::load(
  const std::string& text ) const
{
  bool blank = true;
  for ( char c : text ) {
    if ( !std::isspace(static_cast< unsigned char >(c)) ) {
      blank = false;
      break;
    }
  }
  if ( blank ) return ConfigNode::root( options_ );

  ordered_node dom;
  try {
    dom = ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw std::runtime_error( std::string("YAML parse error: ")
      + ex.what() );
  }

  if ( dom.is_null() ) return ConfigNode::root( options_ );
  return ConfigNode::root( std::move(dom), options_ );
}

inline std::string yomap::YamlLoader::to_string( const ConfigNode& node ) {
  if ( node.is_virtual() ) return std::string();
  if ( !internal::has_block_children(node) ) {
    return ordered_node::serialize( node.value() );
  }

  std::ostringstream out;
  internal::emit_comment( node, std::string(), out );
  internal::emit_block( node, 0, out );
  return out.str();
}

inline void yomap::YamlLoader::save( const ConfigNode& node,
  std::ostream& out )
{
  out << to_string( node );
}
