#pragma once

#include <boxcollide/bbox.hpp>
#include <boxcollide/box.hpp>
#include <boxcollide/box_manager.hpp>
#include <boxcollide/collision.hpp>
#include <boxcollide/partitioner.hpp>
#include <boxcollide/result.hpp>
