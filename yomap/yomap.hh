// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Single include for the whole library. The order matters: the record
// specializations in object_mapper.hh and the default options defined in
// serializers.hh complete declarations made by the earlier headers.
#include "yomap/errors.hh"
#include "yomap/values.hh"
#include "yomap/types.hh"
#include "yomap/node.hh"
#include "yomap/serializer.hh"
#include "yomap/object_mapper.hh"
#include "yomap/serializers.hh"
#include "yomap/loader.hh"
