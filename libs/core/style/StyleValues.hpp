#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace veneer {

/**
 * Helpers over declaration values and the Qt style sheet vocabulary.
 */
namespace StyleValues {

/**
 * Targets of every url(...) in a value, surrounding quotes removed.
 * "url(%ASSETS_DIR%/check.svg)" -> {"%ASSETS_DIR%/check.svg"}
 */
std::vector<std::string> extractUrls(std::string_view value);

/**
 * Every '#'-prefixed literal outside url(...) and quoted strings.
 * "1px solid #2E2E2E" -> {"#2E2E2E"}
 */
std::vector<std::string> extractHexColors(std::string_view value);

/**
 * True iff the literal is exactly '#' followed by six hex digits.
 */
bool isValidHexColor(std::string_view literal);

/**
 * Any hex form QColor accepts: #RGB, #RRGGBB, #AARRGGBB, #RRRGGGBBB, #RRRRGGGGBBBB.
 */
bool isQtHexColor(std::string_view literal);

bool isKnownProperty(std::string_view property);
bool isKnownPseudoState(std::string_view state);
bool isKnownSubControl(std::string_view subControl);

} // namespace StyleValues

} // namespace veneer
