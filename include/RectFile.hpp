#ifndef REDACT_RECT_FILE_HPP
#define REDACT_RECT_FILE_HPP

#include "BoxModel.hpp"

#include <string>

namespace redact {

/**
 * @brief Parse caller-supplied rectangles
 *
 * The text is a JSON object keyed by 1-based page number, each value an
 * array of {"x0", "y0", "x1", "y1"} in PDF points. The result holds Manual
 * boxes keyed by 0-based page index.
 *
 * @throws ValidationError naming the page and field of the first problem
 */
PageBoxMap parseRectJson(const std::string &text);

/**
 * @brief Read and parse a rectangle file
 * @throws InputError if the file cannot be read
 * @throws ValidationError if its content is invalid
 */
PageBoxMap loadRectFile(const std::string &path);

/**
 * @brief Reject boxes on pages the document does not have
 * @throws ValidationError naming the 1-based page
 */
void validateAgainstPageCount(const PageBoxMap &boxes, int pageCount);

} // namespace redact

#endif // REDACT_RECT_FILE_HPP
