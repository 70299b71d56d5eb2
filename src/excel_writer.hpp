#pragma once
#include "models.hpp"
#include <string>

namespace excel {
// Writes every sheet of `book` to `path`. The file is staged as <path>.tmp and
// renamed into place once complete; on failure `path` is left untouched.
// Throws WorkbookError.
void save_workbook(const Workbook &book, const std::string &path);
}
