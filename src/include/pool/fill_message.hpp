#pragma once
/**
 * @file fill_message.hpp
 * @brief Prompt framing for fill-in-the-middle completion sessions.
 *
 * The backend sees the document with a `>>>CURSOR<<<` marker and is asked to answer with
 * `<output>` that starts with the last few characters before the cursor (the
 * "completion start"). Echoing those characters anchors the model at the cursor; the
 * echo is stripped again before the completion is returned.
 */
#include "ph_base.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace poolhub::pool
{

/// Target length of the echoed completion start; extended to the next word boundary.
inline constexpr size_t COMPLETION_START_LENGTH = 10;

inline constexpr std::string_view kWarmupPrefix = "Two plus two equals ";
inline constexpr std::string_view kWarmupSuffix = ".";
inline constexpr std::string_view kWarmupExpected = "four";

struct FillMessage
{
    std::string message;
    std::string completion_start;
};

/** @brief Splits @p prefix into the displayed head and the completion start. */
POOLHUB_UTILS_EXPORT std::pair<std::string, std::string>
split_completion_start(std::string_view prefix);

POOLHUB_UTILS_EXPORT FillMessage build_fill_message(std::string_view prefix,
                                                    std::string_view suffix);

/**
 * @brief Text between the first `<output>` and the last `</output>`, or @p raw unchanged
 *        when the tags are missing or out of order.
 */
POOLHUB_UTILS_EXPORT std::string extract_output(std::string_view raw);

/**
 * @brief Removes the echoed completion start.
 * @return Empty if @p output does not begin with @p completion_start.
 */
POOLHUB_UTILS_EXPORT std::optional<std::string>
strip_completion_start(std::string_view output, std::string_view completion_start);

/** @brief Default system prompt of completion sessions. */
POOLHUB_UTILS_EXPORT const std::string &default_completion_system_prompt();

} // namespace poolhub::pool
