#include "excel_writer.hpp"
#include "util_text.hpp"

#include <xlsxwriter.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct WorkbookDeleter {
    void operator()(lxw_workbook *wb) const { lxw_workbook_free(wb); }
};
using WorkbookPtr = std::unique_ptr<lxw_workbook, WorkbookDeleter>;

class FormatCache {
public:
    explicit FormatCache(lxw_workbook *wb) : wb_(wb) {}

    lxw_format *get(const excel::CellStyle &style) {
        if (style.is_default()) return nullptr;
        auto it = formats_.find(style);
        if (it != formats_.end()) return it->second;

        lxw_format *f = workbook_add_format(wb_);
        if (style.bold) format_set_bold(f);
        if (style.fill) {
            format_set_pattern(f, LXW_PATTERN_SOLID);
            format_set_bg_color(f, static_cast<lxw_color_t>(*style.fill));
        }
        if (!style.numFormat.empty()) format_set_num_format(f, style.numFormat.c_str());
        else if (style.numFormatId != 0) format_set_num_format_index(f, static_cast<uint8_t>(style.numFormatId));
        formats_.emplace(style, f);
        return f;
    }

private:
    lxw_workbook *wb_;
    std::map<excel::CellStyle, lxw_format *> formats_;
};

struct ArrayRange {
    util::CellRef first;
    util::CellRef last;

    bool covers(const util::CellRef &r) const {
        return r.row >= first.row && r.row <= last.row && r.col >= first.col && r.col <= last.col;
    }
};

ArrayRange array_range(const std::string &sheet, const util::CellRef &anchor, const std::string &range) {
    const auto colon = range.find(':');
    auto first = util::parse_cell_ref(range.substr(0, colon));
    auto last = colon == std::string::npos ? first : util::parse_cell_ref(range.substr(colon + 1));
    if (!first || !last || *first != anchor || last->row < first->row || last->col < first->col) {
        throw excel::WorkbookError(fmt::format("sheet '{}' cell {} has an invalid array range '{}'",
            sheet, util::to_a1(anchor), range));
    }
    return {*first, *last};
}

lxw_error write_cell(lxw_worksheet *ws, const util::CellRef &ref, const excel::Cell &c, lxw_format *f,
                     const ArrayRange *array) {
    const auto row = static_cast<lxw_row_t>(ref.row);
    const auto col = static_cast<lxw_col_t>(ref.col);
    if (array) {
        const auto last_row = static_cast<lxw_row_t>(array->last.row);
        const auto last_col = static_cast<lxw_col_t>(array->last.col);
        if (c.kind == excel::CellKind::Number)
            return worksheet_write_array_formula_num(ws, row, col, last_row, last_col, c.formula.c_str(), f, c.number);
        return worksheet_write_array_formula(ws, row, col, last_row, last_col, c.formula.c_str(), f);
    }
    if (!c.formula.empty()) {
        if (c.kind == excel::CellKind::Number)
            return worksheet_write_formula_num(ws, row, col, c.formula.c_str(), f, c.number);
        return worksheet_write_formula(ws, row, col, c.formula.c_str(), f);
    }
    switch (c.kind) {
    case excel::CellKind::Number:  return worksheet_write_number(ws, row, col, c.number, f);
    case excel::CellKind::Text:    return worksheet_write_string(ws, row, col, c.text.c_str(), f);
    case excel::CellKind::Boolean: return worksheet_write_boolean(ws, row, col, c.number != 0.0, f);
    case excel::CellKind::Blank:   break;
    }
    return worksheet_write_blank(ws, row, col, f);
}

bool is_macro_enabled(const std::string &path) {
    const std::string ext = fs::path(path).extension().string();
    return util::iequals(ext, ".xlsm");
}

void remove_quietly(const std::string &path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

namespace excel {

void save_workbook(const Workbook &book, const std::string &path) {
    const std::string tmp = path + ".tmp";
    const std::string vba_tmp = path + ".vba.tmp";

    WorkbookPtr wb(workbook_new(tmp.c_str()));
    if (!wb) throw WorkbookError(fmt::format("cannot create workbook '{}'", tmp));

    FormatCache formats(wb.get());
    for (const auto &sheet : book.sheets) {
        lxw_worksheet *ws = workbook_add_worksheet(wb.get(), sheet.name().c_str());
        if (!ws) throw WorkbookError(fmt::format("cannot add sheet '{}' to '{}'", sheet.name(), path));
        if (!sheet.code_name().empty()) {
            lxw_error err = worksheet_set_vba_name(ws, sheet.code_name().c_str());
            if (err != LXW_NO_ERROR) {
                throw WorkbookError(fmt::format("cannot set code name of sheet '{}': {}", sheet.name(),
                    lxw_strerror(err)));
            }
        }

        // The anchor of an array formula writes its whole range.
        std::vector<ArrayRange> arrays;
        for (const auto &kv : sheet.cells()) {
            if (!kv.second.arrayRange.empty() && !kv.second.formula.empty())
                arrays.push_back(array_range(sheet.name(), kv.first, kv.second.arrayRange));
        }

        for (const auto &kv : sheet.cells()) {
            const ArrayRange *array = nullptr;
            bool inside = false;
            for (const auto &a : arrays) {
                if (a.first == kv.first) array = &a;
                else if (a.covers(kv.first)) inside = true;
            }
            if (inside && !array) continue;

            lxw_error err = write_cell(ws, kv.first, kv.second, formats.get(kv.second.style), array);
            if (err != LXW_NO_ERROR) {
                throw WorkbookError(fmt::format("cannot write {}!{}: {}", sheet.name(),
                    util::to_a1(kv.first), lxw_strerror(err)));
            }
        }
    }

    if (!book.codeName.empty()) {
        lxw_error err = workbook_set_vba_name(wb.get(), book.codeName.c_str());
        if (err != LXW_NO_ERROR)
            throw WorkbookError(fmt::format("cannot set workbook code name: {}", lxw_strerror(err)));
    }

    const bool with_vba = !book.vbaProject.empty() && is_macro_enabled(path);
    if (with_vba) {
        std::ofstream out(vba_tmp, std::ios::binary | std::ios::trunc);
        out.write(book.vbaProject.data(), static_cast<std::streamsize>(book.vbaProject.size()));
        if (!out) {
            remove_quietly(vba_tmp);
            throw WorkbookError(fmt::format("cannot stage VBA project for '{}'", path));
        }
        out.close();
        lxw_error err = workbook_add_vba_project(wb.get(), vba_tmp.c_str());
        if (err != LXW_NO_ERROR) {
            remove_quietly(vba_tmp);
            throw WorkbookError(fmt::format("cannot attach VBA project to '{}': {}", path, lxw_strerror(err)));
        }
    }

    // workbook_close frees the workbook whatever the outcome.
    lxw_error err = workbook_close(wb.release());
    if (with_vba) remove_quietly(vba_tmp);
    if (err != LXW_NO_ERROR) {
        remove_quietly(tmp);
        throw WorkbookError(fmt::format("cannot write '{}': {}", path, lxw_strerror(err)));
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        remove_quietly(tmp);
        throw WorkbookError(fmt::format("cannot replace '{}': {}", path, ec.message()));
    }
}

} // namespace excel
