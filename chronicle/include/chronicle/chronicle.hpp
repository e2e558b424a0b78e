#pragma once

#include "byte_source.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "message_filter.hpp"
#include "message_iterator.hpp"
#include "query_engine.hpp"
#include "reader.hpp"
#include "replay.hpp"
#include "summary.hpp"
#include "types.hpp"
