#pragma once

// Records shared by the yomap unit tests

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "yomap/yomap.hh"

namespace yomap_test {

  enum class Color { RED, GREEN, BLUE };

} // namespace yomap_test

// Declared before any record maps a Color field
template <>
struct yomap::EnumNames< yomap_test::Color > {
  static inline const std::vector< std::pair< std::string, yomap_test::Color > >
    constants = {
      { "RED", yomap_test::Color::RED },
      { "GREEN", yomap_test::Color::GREEN },
      { "BLUE", yomap_test::Color::BLUE }
    };
};

namespace yomap_test {

  struct Scalars {
    std::string text;
    bool flag = false;
    int count = 0;
    std::int64_t big = 0;
    short small = 0;
    std::int8_t tiny = 0;
    float ratio = 0.f;
    double precise = 0.;
    Color color = Color::RED;

    static void map_fields( yomap::RecordBuilder< Scalars >& b ) {
      b.field( "text", &Scalars::text );
      b.field( "flag", &Scalars::flag );
      b.field( "count", &Scalars::count );
      b.field( "big", &Scalars::big );
      b.field( "small", &Scalars::small );
      b.field( "tiny", &Scalars::tiny );
      b.field( "ratio", &Scalars::ratio );
      b.field( "precise", &Scalars::precise );
      b.field( "color", &Scalars::color );
    }
  };

  struct Locators {
    yomap::Uuid id;
    std::optional< yomap::Uri > link;
    std::optional< yomap::Url > site;
    yomap::Pattern filter;

    static void map_fields( yomap::RecordBuilder< Locators >& b ) {
      b.field( "id", &Locators::id );
      b.field( "link", &Locators::link );
      b.field( "site", &Locators::site );
      b.field( "filter", &Locators::filter );
    }
  };

  struct Containers {
    std::vector< int > numbers;
    std::vector< std::string > words;
    yomap::ordered_map< std::string, int > counts;
    std::map< std::string, double > weights;
    yomap::ordered_map< Color, int > by_color;

    static void map_fields( yomap::RecordBuilder< Containers >& b ) {
      b.field( "numbers", &Containers::numbers );
      b.field( "words", &Containers::words );
      b.field( "counts", &Containers::counts );
      b.field( "weights", &Containers::weights );
      b.field( "by-color", &Containers::by_color );
    }
  };

  struct Named {
    std::string item_name;

    static void map_fields( yomap::RecordBuilder< Named >& b ) {
      b.field( "item_name", &Named::item_name )
        .path( "item-name" )
        .comment( "Display name of the item" );
    }
  };

  struct Base {
    std::string id = "base";
    int level = 1;

    static void map_fields( yomap::RecordBuilder< Base >& b ) {
      b.field( "id", &Base::id );
      b.field( "level", &Base::level );
    }
  };

  // Claims the "id" path for its own member
  struct Derived : Base {
    std::string derived_id = "derived";

    static void map_fields( yomap::RecordBuilder< Derived >& b ) {
      b.field( "derived_id", &Derived::derived_id ).path( "id" );
      b.inherit< Base >();
    }
  };

  struct Shape {
    virtual ~Shape() = default;
    virtual double area() const = 0;

    std::string name;

    static void map_fields( yomap::RecordBuilder< Shape >& b ) {
      b.field( "name", &Shape::name );
    }
  };

  struct Circle : Shape {
    double radius = 1.;
    double area() const override { return 3.14159 * radius * radius; }

    static void map_fields( yomap::RecordBuilder< Circle >& b ) {
      b.inherit< Shape >();
      b.field( "radius", &Circle::radius );
    }
  };

  struct Square : Shape {
    double side = 1.;
    double area() const override { return side * side; }

    static void map_fields( yomap::RecordBuilder< Square >& b ) {
      b.inherit< Shape >();
      b.field( "side", &Square::side );
    }
  };

  struct Drawing {
    std::shared_ptr< Shape > main;
    std::vector< std::shared_ptr< Shape > > layers;

    static void map_fields( yomap::RecordBuilder< Drawing >& b ) {
      b.field( "main", &Drawing::main );
      b.field( "layers", &Drawing::layers );
    }
  };

  struct Frame {
    Square border;

    static void map_fields( yomap::RecordBuilder< Frame >& b ) {
      b.field( "border", &Frame::border );
    }
  };

  struct Defaults {
    std::string name = "default";
    int count = 42;
    std::vector< std::string > tags = { "a", "b" };
    std::optional< std::string > note;

    static void map_fields( yomap::RecordBuilder< Defaults >& b ) {
      b.field( "name", &Defaults::name )
        .comment( "Name used when none is configured" );
      b.field( "count", &Defaults::count );
      b.field( "tags", &Defaults::tags );
      b.field( "note", &Defaults::note );
    }
  };

  struct NoDefault {
    explicit NoDefault( int v ) : value( v ) {}
    int value;

    static void map_fields( yomap::RecordBuilder< NoDefault >& b ) {
      b.field( "value", &NoDefault::value );
    }
  };

  struct Tree {
    std::string label;
    std::vector< Tree > children;

    static void map_fields( yomap::RecordBuilder< Tree >& b ) {
      b.field( "label", &Tree::label );
      b.field( "children", &Tree::children );
    }
  };

  // Fresh factory with the Shape subtypes registered under short tags
  inline std::shared_ptr< yomap::ObjectMapperFactory > shape_factory() {
    auto factory = std::make_shared< yomap::ObjectMapperFactory >();
    factory->register_subtype< Shape, Circle >( "circle" );
    factory->register_subtype< Shape, Square >( "square" );
    return factory;
  }

} // namespace yomap_test
