// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_set>

// Scalar value types with a canonical textual grammar. Each parse() throws
// std::invalid_argument (std::regex_error for Pattern) on malformed input.

namespace yomap {

  // 128-bit universally unique identifier in the 8-4-4-4-12 hex layout
  class Uuid {
  public:
    Uuid() = default; // nil UUID
    explicit Uuid( const std::array< std::uint8_t, 16 >& bytes )
      : bytes_( bytes ) {}

    static Uuid parse( const std::string& text );

    // Lowercase canonical form
    std::string to_string() const;

    bool is_nil() const;
    const std::array< std::uint8_t, 16 >& bytes() const { return bytes_; }

    bool operator==( const Uuid& other ) const
      { return bytes_ == other.bytes_; }
    bool operator!=( const Uuid& other ) const
      { return bytes_ != other.bytes_; }
    bool operator<( const Uuid& other ) const
      { return bytes_ < other.bytes_; }

  private:
    std::array< std::uint8_t, 16 > bytes_ = {};
  };

  // RFC 3986 URI reference (absolute or relative)
  class Uri {
  public:
    Uri() = default;

    static Uri parse( const std::string& text );

    // Recomposed reference; identical to the parsed input
    std::string to_string() const;

    bool is_absolute() const { return scheme_.has_value(); }
    const std::optional< std::string >& scheme() const { return scheme_; }
    const std::optional< std::string >& authority() const
      { return authority_; }
    const std::string& path() const { return path_; }
    const std::optional< std::string >& query() const { return query_; }
    const std::optional< std::string >& fragment() const
      { return fragment_; }

    bool operator==( const Uri& other ) const
      { return to_string() == other.to_string(); }
    bool operator!=( const Uri& other ) const { return !( *this == other ); }

  private:
    std::optional< std::string > scheme_;
    std::optional< std::string > authority_;
    std::string path_;
    std::optional< std::string > query_;
    std::optional< std::string > fragment_;
  };

  // Absolute locator: a URI whose scheme names a known protocol
  class Url {
  public:
    Url() = default;

    static Url parse( const std::string& text );

    std::string to_string() const { return uri_.to_string(); }
    std::string protocol() const;
    const Uri& uri() const { return uri_; }

    bool operator==( const Url& other ) const { return uri_ == other.uri_; }
    bool operator!=( const Url& other ) const { return uri_ != other.uri_; }

  private:
    explicit Url( Uri uri ) : uri_( std::move(uri) ) {}

    Uri uri_;
  };

  // Compiled ECMAScript regular expression that remembers its source text
  class Pattern {
  public:
    Pattern() : Pattern( std::string() ) {}
    explicit Pattern( const std::string& source )
      : source_( source ), regex_( source, std::regex::ECMAScript ) {}

    const std::string& pattern() const { return source_; }
    const std::regex& regex() const { return regex_; }

    bool matches( const std::string& text ) const
      { return std::regex_match( text, regex_ ); }
    bool search( const std::string& text ) const
      { return std::regex_search( text, regex_ ); }

    bool operator==( const Pattern& other ) const
      { return source_ == other.source_; }
    bool operator!=( const Pattern& other ) const
      { return source_ != other.source_; }

  private:
    std::string source_;
    std::regex regex_;
  };

namespace internal {

  inline int hex_digit_value( char ch ) {
    if ( ch >= '0' && ch <= '9' ) return ch - '0';
    if ( ch >= 'a' && ch <= 'f' ) return ch - 'a' + 10;
    if ( ch >= 'A' && ch <= 'F' ) return ch - 'A' + 10;
    return -1;
  }

  inline std::string to_lower( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::tolower(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  // Characters allowed to appear literally in a URI reference
  inline bool is_uri_char( unsigned char c ) {
    if ( std::isalnum(c) ) return true;
    if ( c == 0 ) return false;
    return std::strchr( "-._~:/?#[]@!$&'()*+,;=", c ) != nullptr;
  }

} // namespace yomap::internal

} // namespace yomap

// Uuid member function definitions

inline yomap::Uuid yomap::Uuid::parse( const std::string& text ) {
  // Dashes separate the 8-4-4-4-12 groups
  static constexpr std::size_t DASHES[] = { 8, 13, 18, 23 };
  if ( text.size() != 36 ) {
    throw std::invalid_argument( "Invalid UUID string: " + text );
  }

  std::array< std::uint8_t, 16 > bytes = {};
  std::size_t out = 0;
  for ( std::size_t i = 0; i < text.size(); ) {
    if ( i == DASHES[0] || i == DASHES[1] || i == DASHES[2]
      || i == DASHES[3] )
    {
      if ( text[i] != '-' ) {
        throw std::invalid_argument( "Invalid UUID string: " + text );
      }
      ++i;
      continue;
    }
    const int hi = internal::hex_digit_value( text[i] );
    const int lo = internal::hex_digit_value( text[i + 1] );
    if ( hi < 0 || lo < 0 ) {
      throw std::invalid_argument( "Invalid UUID string: " + text );
    }
    bytes[ out++ ] = static_cast< std::uint8_t >( (hi << 4) | lo );
    i += 2;
  }
  return Uuid( bytes );
}

inline std::string yomap::Uuid::to_string() const {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string s;
  s.reserve( 36 );
  for ( std::size_t i = 0; i < bytes_.size(); ++i ) {
    if ( i == 4 || i == 6 || i == 8 || i == 10 ) s += '-';
    s += HEX[ bytes_[i] >> 4 ];
    s += HEX[ bytes_[i] & 0x0F ];
  }
  return s;
}

inline bool yomap::Uuid::is_nil() const {
  for ( std::uint8_t b : bytes_ ) {
    if ( b != 0 ) return false;
  }
  return true;
}

// Uri member function definitions

inline yomap::Uri yomap::Uri::parse( const std::string& text ) {
  // Character scan: literal characters and %XX escapes only
  for ( std::size_t i = 0; i < text.size(); ++i ) {
    const unsigned char c = static_cast< unsigned char >( text[i] );
    if ( c == '%' ) {
      if ( i + 2 >= text.size()
        || internal::hex_digit_value( text[i + 1] ) < 0
        || internal::hex_digit_value( text[i + 2] ) < 0 )
      {
        throw std::invalid_argument( "Malformed escape pair at index "
          + std::to_string( i ) + ": " + text );
      }
      i += 2;
      continue;
    }
    if ( !internal::is_uri_char(c) ) {
      throw std::invalid_argument( "Illegal character at index "
        + std::to_string( i ) + ": " + text );
    }
  }

  // Component split from RFC 3986, appendix B
  static const std::regex grammar(
    R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?$)" );
  static const std::regex scheme_grammar( R"(^[A-Za-z][A-Za-z0-9+.\-]*$)" );

  std::smatch m;
  if ( !std::regex_match( text, m, grammar ) ) {
    throw std::invalid_argument( "Malformed URI: " + text );
  }

  Uri uri;
  if ( m[2].matched ) {
    const std::string scheme = m[2].str();
    if ( !std::regex_match( scheme, scheme_grammar ) ) {
      throw std::invalid_argument( "Illegal character in scheme name: "
        + text );
    }
    uri.scheme_ = scheme;
  }
  if ( m[3].matched ) uri.authority_ = m[4].str();
  uri.path_ = m[5].str();
  if ( m[6].matched ) uri.query_ = m[7].str();
  if ( m[8].matched ) uri.fragment_ = m[9].str();

  if ( uri.scheme_ && !uri.authority_ && uri.path_.empty() && !uri.query_ ) {
    throw std::invalid_argument( "Expected scheme-specific part: " + text );
  }

  // Square brackets are only meaningful around an IP literal host
  auto has_bracket = []( const std::string& s ) {
    return s.find_first_of( "[]" ) != std::string::npos;
  };
  if ( has_bracket(uri.path_) || ( uri.query_ && has_bracket(*uri.query_) )
    || ( uri.fragment_ && has_bracket(*uri.fragment_) ) )
  {
    throw std::invalid_argument( "Illegal character in path: " + text );
  }
  if ( uri.fragment_ && uri.fragment_->find('#') != std::string::npos ) {
    throw std::invalid_argument( "Illegal character in fragment: " + text );
  }
  return uri;
}

inline std::string yomap::Uri::to_string() const {
  std::string s;
  if ( scheme_ ) s += *scheme_ + ':';
  if ( authority_ ) s += "//" + *authority_;
  s += path_;
  if ( query_ ) s += '?' + *query_;
  if ( fragment_ ) s += '#' + *fragment_;
  return s;
}

// Url member function definitions

inline yomap::Url yomap::Url::parse( const std::string& text ) {
  static const std::unordered_set< std::string > KNOWN_PROTOCOLS = {
    "http", "https", "ftp", "file", "jar", "mailto"
  };

  Uri uri = Uri::parse( text );
  if ( !uri.is_absolute() ) {
    throw std::invalid_argument( "no protocol: " + text );
  }
  const std::string protocol = internal::to_lower( *uri.scheme() );
  if ( !KNOWN_PROTOCOLS.count(protocol) ) {
    throw std::invalid_argument( "unknown protocol: " + protocol );
  }
  return Url( std::move(uri) );
}

inline std::string yomap::Url::protocol() const {
  if ( !uri_.scheme() ) return std::string();
  return internal::to_lower( *uri_.scheme() );
}
