// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <any>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

// ABI demangler (GCC/Clang)
#include <cxxabi.h>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "yomap/values.hh"

namespace yomap {

  // Insertion-ordered map, the natural field type for YAML mappings
  template < typename Key, typename Value >
  using ordered_map = fkyaml::ordered_map< Key, Value >;

  class TypeToken;
  class ObjectMapperBase;

  template < typename T >
  class RecordBuilder;

  enum class TypeKind {
    Scalar, // string, boolean, numbers, UUID, URI, URL, pattern
    Enum,   // enumeration with declared constant names
    List,   // std::vector< E >
    Map,    // std::map< K, V > or ordered_map< K, V >
    Record, // structured type declaring map_fields()
    Family  // wildcard used only for serializer registration
  };

  // Declared width of a numeric scalar
  enum class NumberKind { None, Byte, Short, Int, Long, Float, Double };

  // Type-erased operations attached to a token. Values cross these
  // boundaries boxed in std::any; an empty std::any means "no value".
  // Records always travel as std::shared_ptr< T >.

  struct NumberOps {
    std::any (*from_integer)( std::int64_t value );
    std::any (*from_float)( double value );
    std::int64_t (*to_integer)( const std::any& value );
    double (*to_float)( const std::any& value );
  };

  struct ListOps {
    std::any (*make)();
    void (*append)( std::any& list, std::any element );
    std::vector< std::any > (*elements)( const std::any& list );
  };

  struct MapOps {
    std::any (*make)();
    // Inserts or overwrites the entry for key
    void (*put)( std::any& map, std::any key, std::any value );
    std::vector< std::pair< std::any, std::any > > (*entries)(
      const std::any& map );
  };

  struct EnumOps {
    // Empty result when no constant has this exact name
    std::any (*value_of)( const std::string& name );
    std::optional< std::string > (*name_of)( const std::any& value );
  };

  struct RecordOps {
    std::vector< TypeToken > (*supertypes)();
    std::shared_ptr< const ObjectMapperBase > (*make_mapper)();
    // Converts a freshly constructed T into a boxed std::shared_ptr< T >
    std::any (*wrap)( std::shared_ptr< void > instance );
    // Address of the T held by a boxed pointer (nullptr when empty)
    void* (*address)( const std::any& value );
    // Dynamic type of the object held by a boxed pointer
    std::type_index (*runtime_type)( const std::any& value );
  };

  // Runtime description of a mappable C++ type. One static instance exists
  // per type; TypeToken is a cheap handle to it.
  struct TypeInfo {
    explicit TypeInfo( std::type_index raw_type ) : raw( raw_type ) {}

    std::type_index raw;
    std::string (*name)() = nullptr;
    TypeKind kind = TypeKind::Scalar;
    NumberKind number_kind = NumberKind::None;
    bool is_abstract = false;

    // Generic parameters, resolved lazily so recursive records can refer to
    // themselves through containers
    std::vector< TypeToken (*)() > parameters;

    // Family tokens only: does the candidate belong to the family?
    bool (*family_match)( const TypeInfo& candidate ) = nullptr;

    const NumberOps* number = nullptr;
    const ListOps* list = nullptr;
    const MapOps* map = nullptr;
    const EnumOps* enumeration = nullptr;
    const RecordOps* record = nullptr;
  };

  class TypeToken {
  public:
    explicit TypeToken( const TypeInfo& info ) : info_( &info ) {}

    const TypeInfo& info() const { return *info_; }
    std::type_index raw() const { return info_->raw; }
    std::string name() const { return info_->name(); }
    TypeKind kind() const { return info_->kind; }
    NumberKind number_kind() const { return info_->number_kind; }
    bool is_abstract() const { return info_->is_abstract; }

    std::size_t parameter_count() const { return info_->parameters.size(); }
    TypeToken parameter( std::size_t index ) const;

    // True if a value of type other may be handled as this type: identical
    // types, declared record inheritance, or membership in a family
    bool is_supertype_of( const TypeToken& other ) const;

    bool operator==( const TypeToken& other ) const
      { return raw() == other.raw(); }
    bool operator!=( const TypeToken& other ) const
      { return raw() != other.raw(); }

  private:
    const TypeInfo* info_;
  };

  // Predicate form of TypeToken::is_supertype_of, used when registering a
  // serializer for a type and everything deriving from it
  class SuperTypePredicate {
  public:
    explicit SuperTypePredicate( TypeToken type ) : type_( type ) {}

    bool operator()( const TypeToken& candidate ) const {
      return type_.is_supertype_of( candidate );
    }

    const TypeToken& type() const { return type_; }

  private:
    TypeToken type_;
  };

  // Enumerations become mappable by specializing EnumNames with a static
  // `constants` member listing (declared name, value) pairs, e.g.
  //
  //   template <> struct yomap::EnumNames< Color > {
  //     static inline const std::vector< std::pair< std::string, Color > >
  //       constants = { { "RED", Color::RED }, { "GREEN", Color::GREEN } };
  //   };
  template < typename E >
  struct EnumNames {};

  // Specialized per supported type category; type_of< T >() fails to
  // compile for types with no mapping
  template < typename T, typename = void >
  struct TypeInfoFor;

  template < typename T >
  TypeToken type_of() {
    return TypeToken( TypeInfoFor< T >::get() );
  }

  // Category detection

  template < typename T, typename = void >
  struct is_record : std::false_type {};

  template < typename T >
  struct is_record< T, std::void_t< decltype(
    T::map_fields( std::declval< RecordBuilder< T >& >() ) ) > >
    : std::true_type {};

  template < typename T >
  inline constexpr bool is_record_v = is_record< T >::value;

  template < typename E, typename = void >
  struct has_enum_names : std::false_type {};

  template < typename E >
  struct has_enum_names< E, std::void_t<
    decltype( EnumNames< E >::constants ) > > : std::true_type {};

  template < typename T, typename = void >
  struct has_type_info : std::false_type {};

  template < typename T >
  struct has_type_info< T, std::void_t<
    decltype( TypeInfoFor< T >::get() ) > > : std::true_type {};

  // Conversion between a field's storage type and its boxed form. The
  // primary template covers scalars, enums and containers, which are boxed
  // as themselves. Records, std::optional and std::shared_ptr are
  // specialized.
  template < typename T, typename = void >
  struct ValueTraits {
    static TypeToken token() { return type_of< T >(); }

    static std::any box( const T& value ) { return std::any( value ); }

    // A missing value resets the field to its value-initialized state
    static T unbox( std::any value ) {
      if ( !value.has_value() ) return T();
      return std::any_cast< T >( std::move(value) );
    }
  };

  // Records are boxed as std::shared_ptr< T > holding a copy
  template < typename T >
  struct ValueTraits< T, std::enable_if_t< is_record< T >::value > > {
    static TypeToken token() { return type_of< T >(); }

    static std::any box( const T& value ) {
      return std::any( std::make_shared< T >( value ) );
    }

    static T unbox( std::any value ) {
      if ( !value.has_value() ) return T();
      auto p = std::any_cast< std::shared_ptr< T > >( std::move(value) );
      if ( !p ) return T();
      return *p;
    }
  };

  template < typename U >
  struct ValueTraits< std::optional< U > > {
    static TypeToken token() { return ValueTraits< U >::token(); }

    static std::any box( const std::optional< U >& value ) {
      if ( !value ) return std::any();
      return ValueTraits< U >::box( *value );
    }

    static std::optional< U > unbox( std::any value ) {
      if ( !value.has_value() ) return std::nullopt;
      return ValueTraits< U >::unbox( std::move(value) );
    }
  };

  template < typename R >
  struct ValueTraits< std::shared_ptr< R > > {
    static TypeToken token() { return type_of< R >(); }

    static std::any box( const std::shared_ptr< R >& value ) {
      if ( !value ) return std::any();
      return std::any( value );
    }

    static std::shared_ptr< R > unbox( std::any value ) {
      if ( !value.has_value() ) return nullptr;
      return std::any_cast< std::shared_ptr< R > >( std::move(value) );
    }
  };

  // Whether a member of type T can be registered as a mapped field
  template < typename T >
  struct is_mappable : has_type_info< T > {};

  template < typename U >
  struct is_mappable< std::optional< U > > : is_mappable< U > {};

  // Only records are shared by pointer
  template < typename R >
  struct is_mappable< std::shared_ptr< R > > : is_record< R > {};

  template < typename T >
  inline constexpr bool is_mappable_v = is_mappable< T >::value;

  // Wildcard tokens for registering one serializer for a whole category
namespace types {
  TypeToken any_number();
  TypeToken any_list();
  TypeToken any_map();
  TypeToken any_enum();
  TypeToken any_record();
} // namespace yomap::types

namespace internal {

  inline std::string demangle( const char* mangled ) {
    int status = 0;
    std::unique_ptr< char, void (*)( void* ) > out(
      abi::__cxa_demangle( mangled, nullptr, nullptr, &status ), std::free );
    if ( status == 0 && out ) return std::string( out.get() );
    return std::string( mangled );
  }

  template < typename T >
  std::string type_name() {
    return demangle( typeid(T).name() );
  }

  template < typename T >
  constexpr NumberKind number_kind_of() {
    if constexpr ( std::is_floating_point_v< T > ) {
      return sizeof( T ) <= sizeof( float ) ? NumberKind::Float
        : NumberKind::Double;
    }
    else {
      if constexpr ( sizeof(T) == 1 ) return NumberKind::Byte;
      else if constexpr ( sizeof(T) == 2 ) return NumberKind::Short;
      else if constexpr ( sizeof(T) == 4 ) return NumberKind::Int;
      else return NumberKind::Long;
    }
  }

  inline const char* number_kind_name( NumberKind kind ) {
    switch ( kind ) {
      case NumberKind::Byte: return "byte";
      case NumberKind::Short: return "short";
      case NumberKind::Int: return "int";
      case NumberKind::Long: return "long";
      case NumberKind::Float: return "float";
      case NumberKind::Double: return "double";
      default: return "none";
    }
  }

  template < typename T >
  const NumberOps& number_ops() {
    static const NumberOps ops {
      []( std::int64_t value ) -> std::any {
        return std::any( static_cast< T >( value ) );
      },
      // Empty when value has no representation in T
      []( double value ) -> std::any {
        if constexpr ( std::is_floating_point_v< T > ) {
          if ( std::isfinite(value)
            && std::fabs(value) > std::numeric_limits< T >::max() )
          {
            return std::any();
          }
        }
        else {
          const double t = std::trunc( value );
          if ( !(t >= static_cast< double >(std::numeric_limits< T >::lowest())
            && t < static_cast< double >(std::numeric_limits< T >::max())
              + 1.0) )
          {
            return std::any();
          }
        }
        return std::any( static_cast< T >( value ) );
      },
      []( const std::any& value ) -> std::int64_t {
        return static_cast< std::int64_t >( std::any_cast< T >( value ) );
      },
      []( const std::any& value ) -> double {
        return static_cast< double >( std::any_cast< T >( value ) );
      }
    };
    return ops;
  }

  template < typename C >
  const ListOps& list_ops() {
    using E = typename C::value_type;
    static const ListOps ops {
      []() -> std::any { return std::any( C() ); },
      []( std::any& list, std::any element ) {
        std::any_cast< C& >( list ).push_back(
          ValueTraits< E >::unbox( std::move(element) ) );
      },
      []( const std::any& list ) -> std::vector< std::any > {
        const C& c = std::any_cast< const C& >( list );
        std::vector< std::any > out;
        out.reserve( c.size() );
        for ( const auto& element : c ) {
          out.push_back( ValueTraits< E >::box( element ) );
        }
        return out;
      }
    };
    return ops;
  }

  template < typename M >
  const MapOps& map_ops() {
    using K = typename M::key_type;
    using V = typename M::mapped_type;
    static const MapOps ops {
      []() -> std::any { return std::any( M() ); },
      []( std::any& map, std::any key, std::any value ) {
        M& m = std::any_cast< M& >( map );
        K k = ValueTraits< K >::unbox( std::move(key) );
        V v = ValueTraits< V >::unbox( std::move(value) );
        auto it = m.find( k );
        if ( it != m.end() ) {
          it->second = std::move( v );
        }
        else {
          m.emplace( std::move(k), std::move(v) );
        }
      },
      []( const std::any& map ) {
        const M& m = std::any_cast< const M& >( map );
        std::vector< std::pair< std::any, std::any > > out;
        out.reserve( m.size() );
        for ( const auto& kv : m ) {
          out.emplace_back( ValueTraits< K >::box( kv.first ),
            ValueTraits< V >::box( kv.second ) );
        }
        return out;
      }
    };
    return ops;
  }

  template < typename E >
  const EnumOps& enum_ops() {
    static const EnumOps ops {
      []( const std::string& name ) -> std::any {
        for ( const auto& [n, v] : EnumNames< E >::constants ) {
          if ( n == name ) return std::any( v );
        }
        return std::any();
      },
      []( const std::any& value ) -> std::optional< std::string > {
        const E e = std::any_cast< E >( value );
        for ( const auto& [n, v] : EnumNames< E >::constants ) {
          if ( v == e ) return n;
        }
        return std::nullopt;
      }
    };
    return ops;
  }

  template < typename T >
  TypeInfo make_scalar_info( std::string (*name)() ) {
    TypeInfo info( typeid(T) );
    info.name = name;
    info.kind = TypeKind::Scalar;
    return info;
  }

  // Marker types backing the family tokens
  struct NumberFamily {};
  struct ListFamily {};
  struct MapFamily {};
  struct EnumFamily {};
  struct RecordFamily {};

  template < typename Marker >
  const TypeInfo& family_info( std::string (*name)(),
    bool (*match)( const TypeInfo& ) )
  {
    static const TypeInfo info = [&] {
      TypeInfo i( typeid(Marker) );
      i.name = name;
      i.kind = TypeKind::Family;
      i.family_match = match;
      return i;
    }();
    return info;
  }

} // namespace yomap::internal

  // Numbers: every arithmetic type except bool
  template < typename T >
  struct TypeInfoFor< T, std::enable_if_t< std::is_arithmetic_v< T >
    && !std::is_same_v< T, bool > > >
  {
    static const TypeInfo& get() {
      static const TypeInfo info = [] {
        TypeInfo i( typeid(T) );
        i.name = []() -> std::string {
          std::string n = internal::number_kind_name(
            internal::number_kind_of< T >() );
          if constexpr ( std::is_unsigned_v< T > ) n = "unsigned " + n;
          return n;
        };
        i.kind = TypeKind::Scalar;
        i.number_kind = internal::number_kind_of< T >();
        i.number = &internal::number_ops< T >();
        return i;
      }();
      return info;
    }
  };

  template <>
  struct TypeInfoFor< bool > {
    static const TypeInfo& get() {
      static const TypeInfo info = internal::make_scalar_info< bool >(
        []() -> std::string { return "boolean"; } );
      return info;
    }
  };

  template <>
  struct TypeInfoFor< std::string > {
    static const TypeInfo& get() {
      static const TypeInfo info = internal::make_scalar_info< std::string >(
        []() -> std::string { return "string"; } );
      return info;
    }
  };

  template <>
  struct TypeInfoFor< Uuid > {
    static const TypeInfo& get() {
      static const TypeInfo info = internal::make_scalar_info< Uuid >(
        []() -> std::string { return "uuid"; } );
      return info;
    }
  };

  template <>
  struct TypeInfoFor< Uri > {
    static const TypeInfo& get() {
      static const TypeInfo info = internal::make_scalar_info< Uri >(
        []() -> std::string { return "uri"; } );
      return info;
    }
  };

  template <>
  struct TypeInfoFor< Url > {
    static const TypeInfo& get() {
      static const TypeInfo info = internal::make_scalar_info< Url >(
        []() -> std::string { return "url"; } );
      return info;
    }
  };

  template <>
  struct TypeInfoFor< Pattern > {
    static const TypeInfo& get() {
      static const TypeInfo info = internal::make_scalar_info< Pattern >(
        []() -> std::string { return "pattern"; } );
      return info;
    }
  };

  template < typename E >
  struct TypeInfoFor< E, std::enable_if_t< std::is_enum_v< E >
    && has_enum_names< E >::value > >
  {
    static const TypeInfo& get() {
      static const TypeInfo info = [] {
        TypeInfo i( typeid(E) );
        i.name = &internal::type_name< E >;
        i.kind = TypeKind::Enum;
        i.enumeration = &internal::enum_ops< E >();
        return i;
      }();
      return info;
    }
  };

  template < typename E, typename... Rest >
  struct TypeInfoFor< std::vector< E, Rest... > > {
    using container_type = std::vector< E, Rest... >;

    static const TypeInfo& get() {
      static const TypeInfo info = [] {
        TypeInfo i( typeid(container_type) );
        i.name = []() -> std::string {
          return "list<" + ValueTraits< E >::token().name() + ">";
        };
        i.kind = TypeKind::List;
        i.parameters = { &ValueTraits< E >::token };
        i.list = &internal::list_ops< container_type >();
        return i;
      }();
      return info;
    }
  };

namespace internal {

  template < typename M >
  const TypeInfo& map_info() {
    using K = typename M::key_type;
    using V = typename M::mapped_type;
    static const TypeInfo info = [] {
      TypeInfo i( typeid(M) );
      i.name = []() -> std::string {
        return "map<" + ValueTraits< K >::token().name() + ", "
          + ValueTraits< V >::token().name() + ">";
      };
      i.kind = TypeKind::Map;
      i.parameters = { &ValueTraits< K >::token, &ValueTraits< V >::token };
      i.map = &map_ops< M >();
      return i;
    }();
    return info;
  }

} // namespace yomap::internal

  template < typename K, typename V, typename... Rest >
  struct TypeInfoFor< std::map< K, V, Rest... > > {
    static const TypeInfo& get() {
      return internal::map_info< std::map< K, V, Rest... > >();
    }
  };

  template < typename K, typename V, typename... Rest >
  struct TypeInfoFor< fkyaml::ordered_map< K, V, Rest... > > {
    static const TypeInfo& get() {
      return internal::map_info< fkyaml::ordered_map< K, V, Rest... > >();
    }
  };

} // namespace yomap

// TypeToken member function definitions

inline yomap::TypeToken yomap::TypeToken::parameter( std::size_t index ) const
{
  if ( index >= info_->parameters.size() ) {
    throw std::out_of_range( "Type " + name() + " has no generic parameter "
      + std::to_string( index ) );
  }
  return info_->parameters[ index ]();
}

inline bool yomap::TypeToken::is_supertype_of( const TypeToken& other ) const
{
  if ( raw() == other.raw() ) return true;

  if ( kind() == TypeKind::Family ) {
    return info_->family_match && info_->family_match( other.info() );
  }

  // Records: climb the declared bases of the candidate
  if ( kind() != TypeKind::Record || other.kind() != TypeKind::Record ) {
    return false;
  }
  for ( const TypeToken& base : other.info().record->supertypes() ) {
    if ( this->is_supertype_of( base ) ) return true;
  }
  return false;
}

// Family tokens

inline yomap::TypeToken yomap::types::any_number() {
  return TypeToken( internal::family_info< internal::NumberFamily >(
    []() -> std::string { return "number"; },
    []( const TypeInfo& c ) { return c.number_kind != NumberKind::None; } ) );
}

inline yomap::TypeToken yomap::types::any_list() {
  return TypeToken( internal::family_info< internal::ListFamily >(
    []() -> std::string { return "list<?>"; },
    []( const TypeInfo& c ) { return c.kind == TypeKind::List; } ) );
}

inline yomap::TypeToken yomap::types::any_map() {
  return TypeToken( internal::family_info< internal::MapFamily >(
    []() -> std::string { return "map<?, ?>"; },
    []( const TypeInfo& c ) { return c.kind == TypeKind::Map; } ) );
}

inline yomap::TypeToken yomap::types::any_enum() {
  return TypeToken( internal::family_info< internal::EnumFamily >(
    []() -> std::string { return "enum<?>"; },
    []( const TypeInfo& c ) { return c.kind == TypeKind::Enum; } ) );
}

inline yomap::TypeToken yomap::types::any_record() {
  return TypeToken( internal::family_info< internal::RecordFamily >(
    []() -> std::string { return "record"; },
    []( const TypeInfo& c ) { return c.kind == TypeKind::Record; } ) );
}
