//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/codec/physical_type.hpp"
#include "colwire/codec/physical_type_traits.hpp"
#include "colwire/codec/plain_decoder.hpp"
#include "colwire/codec/plain_encoder.hpp"
#include "colwire/common/binary_search.hpp"
#include "colwire/common/byte_slice.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/shared_buffer.hpp"
#include "colwire/common/string_util.hpp"
#include "colwire/common/types/byte_array.hpp"
#include "colwire/common/types/decimal.hpp"
#include "colwire/common/types/int96.hpp"
#include "colwire/common/types/plain_value.hpp"
#include "colwire/logging/log_manager.hpp"
#include "colwire/main/codec_context.hpp"
#include "colwire/main/config.hpp"
