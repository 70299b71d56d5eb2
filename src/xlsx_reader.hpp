#pragma once
#include "models.hpp"
#include <string>

namespace excel {
// Reads an .xlsx/.xlsm file into memory. Throws WorkbookError on any failure.
Workbook load_workbook(const std::string &path);
}
