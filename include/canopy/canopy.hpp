#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "geojson.hpp"
#include "geometry.hpp"
#include "ingestor.hpp"
#include "overpass.hpp"
#include "proximity.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "tree_model.hpp"
#include "types.hpp"
