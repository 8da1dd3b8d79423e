#pragma once

#include "common/config.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "config/error_codes.hpp"
#include "config/validator.hpp"
#include "progress/byte_stream_progress.hpp"
#include "progress/sequence_progress.hpp"
#include "progress/step_progress.hpp"
#include "source/byte_reader.hpp"
#include "source/item_source.hpp"
#include "source/reader_streambuf.hpp"
