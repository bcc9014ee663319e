#pragma once
/**
 * @file channel_select.hpp
 * @brief Operator channel selection and the Xenoscope default channel table.
 *
 * Selection strings, case-insensitive, surrounding quotes ignored:
 *
 *   "a"  all level meters      -> 1 2 3 4 5
 *   "s"  short level meters    -> 1 2 3
 *   "l"  long level meter      -> 4 5
 *   "1 2 6", "1,4", "145"      -> explicit inputs, one digit per channel
 *
 * Channel 6 carries the 100 pF reference capacitor and is only read when named.
 */

#include "lmreadout/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lmreadout {

enum class SelectResult : uint8_t { Ok=0, Empty, BadCharacter, OutOfRange, Duplicate };

const char* to_string(SelectResult r);

SelectResult parse_selection(const std::string& text, std::vector<uint8_t>& out);

/// "SLM 1" .. "Reference 100 pF"; "CH <n>" for anything else.
LabelStr default_label(uint8_t id);

/// Channels for @p ids with default labels and identity calibration.
ChannelList default_channels(const std::vector<uint8_t>& ids);

} // namespace lmreadout
