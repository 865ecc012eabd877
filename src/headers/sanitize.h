#pragma once
/**
 * Handfont — Input sanitizer
 *
 * Every client string that ends up as a tool argument or as part of a file
 * name passes through here first. The value is read as UTF-8; letters and
 * numbers in any script survive, plus space, '-' and '_'. Malformed UTF-8 is
 * dropped. Leading and trailing spaces are stripped.
 */

#include <string>

std::string sanitize_text(const std::string& value);

// True when `value` is non-empty and already in sanitized form.
bool is_sanitized_key(const std::string& value);
