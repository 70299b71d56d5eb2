#include "xlsx_reader.hpp"
#include "util_text.hpp"

#include <fmt/format.h>
#include <miniz.h>
#include <tinyxml2.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using tinyxml2::XMLElement;

namespace {

class ZipArchive {
public:
    explicit ZipArchive(const std::string &path) : path_(path) {
        if (!mz_zip_reader_init_file(&zip_, path.c_str(), 0)) {
            throw excel::WorkbookError(fmt::format("cannot open workbook '{}': {}", path,
                mz_zip_get_error_string(mz_zip_get_last_error(&zip_))));
        }
    }
    ~ZipArchive() { mz_zip_reader_end(&zip_); }
    ZipArchive(const ZipArchive &) = delete;
    ZipArchive &operator=(const ZipArchive &) = delete;

    bool contains(const std::string &name) {
        return mz_zip_reader_locate_file(&zip_, name.c_str(), nullptr, 0) >= 0;
    }

    std::string read(const std::string &name) {
        size_t size = 0;
        void *data = mz_zip_reader_extract_file_to_heap(&zip_, name.c_str(), &size, 0);
        if (!data) {
            throw excel::WorkbookError(fmt::format("workbook '{}' has no readable part {}", path_, name));
        }
        std::string out(static_cast<const char *>(data), size);
        mz_free(data);
        return out;
    }

    void parse(const std::string &name, tinyxml2::XMLDocument &doc) {
        const std::string text = read(name);
        if (doc.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
            throw excel::WorkbookError(fmt::format("workbook '{}' part {} is malformed: {}",
                path_, name, doc.ErrorStr()));
        }
    }

private:
    mz_zip_archive zip_{};
    std::string path_;
};

// OOXML parts may or may not carry namespace prefixes; compare local names.
const char *local_name(const char *name) {
    const char *colon = std::strchr(name, ':');
    return colon ? colon + 1 : name;
}

const XMLElement *child(const XMLElement *parent, const char *name) {
    if (!parent) return nullptr;
    for (const XMLElement *e = parent->FirstChildElement(); e; e = e->NextSiblingElement())
        if (std::strcmp(local_name(e->Name()), name) == 0) return e;
    return nullptr;
}

template <typename F>
void for_each_child(const XMLElement *parent, const char *name, F f) {
    if (!parent) return;
    for (const XMLElement *e = parent->FirstChildElement(); e; e = e->NextSiblingElement())
        if (std::strcmp(local_name(e->Name()), name) == 0) f(e);
}

std::string attr(const XMLElement *e, const char *name) {
    for (const tinyxml2::XMLAttribute *a = e->FirstAttribute(); a; a = a->Next())
        if (std::strcmp(local_name(a->Name()), name) == 0) return a->Value();
    return "";
}

std::string text_of(const XMLElement *e) {
    const char *t = e ? e->GetText() : nullptr;
    return t ? t : "";
}

// <si> and <is> hold either a single <t> or rich-text runs <r><t>.
std::string rich_text(const XMLElement *e) {
    std::string out = text_of(child(e, "t"));
    for_each_child(e, "r", [&](const XMLElement *run) { out += text_of(child(run, "t")); });
    return out;
}

std::optional<std::uint32_t> parse_rgb(const std::string &argb) {
    if (argb.size() != 6 && argb.size() != 8) return std::nullopt;
    char *end = nullptr;
    const unsigned long v = std::strtoul(argb.c_str(), &end, 16);
    if (*end != '\0') return std::nullopt;
    return static_cast<std::uint32_t>(v & 0xFFFFFF);
}

std::vector<std::string> load_shared_strings(ZipArchive &zip) {
    std::vector<std::string> strings;
    const std::string part = "xl/sharedStrings.xml";
    if (!zip.contains(part)) return strings;

    tinyxml2::XMLDocument doc;
    zip.parse(part, doc);
    for_each_child(doc.RootElement(), "si", [&](const XMLElement *si) {
        strings.push_back(rich_text(si));
    });
    return strings;
}

std::vector<excel::CellStyle> load_styles(ZipArchive &zip) {
    std::vector<excel::CellStyle> styles;
    const std::string part = "xl/styles.xml";
    if (!zip.contains(part)) return styles;

    tinyxml2::XMLDocument doc;
    zip.parse(part, doc);
    const XMLElement *root = doc.RootElement();

    std::map<int, std::string> custom_formats;
    for_each_child(child(root, "numFmts"), "numFmt", [&](const XMLElement *nf) {
        custom_formats[std::atoi(attr(nf, "numFmtId").c_str())] = attr(nf, "formatCode");
    });

    std::vector<bool> bold_fonts;
    for_each_child(child(root, "fonts"), "font", [&](const XMLElement *font) {
        const XMLElement *b = child(font, "b");
        const std::string val = b ? attr(b, "val") : "";
        bold_fonts.push_back(b && val != "0" && val != "false");
    });

    std::vector<std::optional<std::uint32_t>> fills;
    for_each_child(child(root, "fills"), "fill", [&](const XMLElement *fill) {
        const XMLElement *pattern = child(fill, "patternFill");
        std::optional<std::uint32_t> rgb;
        if (pattern && attr(pattern, "patternType") == "solid") {
            if (const XMLElement *fg = child(pattern, "fgColor")) rgb = parse_rgb(attr(fg, "rgb"));
        }
        fills.push_back(rgb);
    });

    for_each_child(child(root, "cellXfs"), "xf", [&](const XMLElement *xf) {
        excel::CellStyle s;
        const auto font = static_cast<std::size_t>(std::atoi(attr(xf, "fontId").c_str()));
        const auto fill = static_cast<std::size_t>(std::atoi(attr(xf, "fillId").c_str()));
        const int numFmt = std::atoi(attr(xf, "numFmtId").c_str());
        if (font < bold_fonts.size()) s.bold = bold_fonts[font];
        if (fill < fills.size()) s.fill = fills[fill];
        auto custom = custom_formats.find(numFmt);
        if (custom != custom_formats.end()) s.numFormat = custom->second;
        else if (numFmt > 0) s.numFormatId = static_cast<std::uint16_t>(numFmt);
        styles.push_back(std::move(s));
    });
    return styles;
}

std::string resolve_target(const std::string &target) {
    if (!target.empty() && target[0] == '/') return target.substr(1);
    if (target.rfind("xl/", 0) == 0) return target;
    return "xl/" + target;
}

void load_sheet(ZipArchive &zip, const std::string &part, excel::Sheet &sheet,
                const std::vector<std::string> &strings,
                const std::vector<excel::CellStyle> &styles) {
    tinyxml2::XMLDocument doc;
    zip.parse(part, doc);
    const XMLElement *data = child(doc.RootElement(), "sheetData");
    if (const XMLElement *pr = child(doc.RootElement(), "sheetPr")) sheet.set_code_name(attr(pr, "codeName"));

    // Shared formula index -> anchor cell and its formula text.
    std::map<std::string, std::pair<util::CellRef, std::string>> shared;
    std::uint32_t next_row = 0;
    for_each_child(data, "row", [&](const XMLElement *row_el) {
        const std::string r = attr(row_el, "r");
        const std::uint32_t row = r.empty() ? next_row : static_cast<std::uint32_t>(std::stoul(r) - 1);
        next_row = row + 1;

        std::uint32_t next_col = 0;
        for_each_child(row_el, "c", [&](const XMLElement *c) {
            util::CellRef ref{row, next_col};
            const std::string a1 = attr(c, "r");
            if (!a1.empty()) {
                auto parsed = util::parse_cell_ref(a1);
                if (!parsed) {
                    throw excel::WorkbookError(fmt::format("sheet '{}' has an invalid cell reference '{}'",
                        sheet.name(), a1));
                }
                ref = *parsed;
            }
            next_col = ref.col + 1;

            excel::Cell cell;
            const std::string s = attr(c, "s");
            if (!s.empty()) {
                const auto idx = static_cast<std::size_t>(std::stoul(s));
                if (idx < styles.size()) cell.style = styles[idx];
            }
            if (const XMLElement *f = child(c, "f")) {
                const std::string kind = attr(f, "t");
                cell.formula = text_of(f);
                if (kind == "shared") {
                    const std::string si = attr(f, "si");
                    if (!cell.formula.empty()) {
                        shared[si] = {ref, cell.formula};
                    } else {
                        auto anchor = shared.find(si);
                        if (anchor == shared.end()) {
                            throw excel::WorkbookError(fmt::format(
                                "sheet '{}' cell {} uses shared formula {} before its anchor",
                                sheet.name(), util::to_a1(ref), si));
                        }
                        const util::CellRef &from = anchor->second.first;
                        cell.formula = util::shift_formula(anchor->second.second,
                            static_cast<std::int64_t>(ref.row) - from.row,
                            static_cast<std::int64_t>(ref.col) - from.col);
                    }
                } else if (kind == "array") {
                    const std::string range = attr(f, "ref");
                    cell.arrayRange = range.empty() ? util::to_a1(ref) : range;
                }
            }

            const std::string type = attr(c, "t");
            const XMLElement *v = child(c, "v");
            const std::string value = text_of(v);
            if (type == "s") {
                const auto idx = static_cast<std::size_t>(std::strtoul(value.c_str(), nullptr, 10));
                if (!v || idx >= strings.size()) {
                    throw excel::WorkbookError(fmt::format("sheet '{}' cell {} points past the shared strings",
                        sheet.name(), util::to_a1(ref)));
                }
                cell.kind = excel::CellKind::Text;
                cell.text = strings[idx];
            } else if (type == "inlineStr") {
                cell.kind = excel::CellKind::Text;
                cell.text = rich_text(child(c, "is"));
            } else if (type == "str" || type == "e") {
                cell.kind = excel::CellKind::Text;
                cell.text = value;
            } else if (type == "b") {
                cell.kind = excel::CellKind::Boolean;
                cell.number = value == "1" ? 1.0 : 0.0;
            } else if (v) {
                cell.kind = excel::CellKind::Number;
                cell.number = std::strtod(value.c_str(), nullptr);
            }

            if (cell.kind == excel::CellKind::Blank && cell.style.is_default() && cell.formula.empty()) return;
            sheet.set(ref, std::move(cell));
        });
    });
}

} // namespace

namespace excel {

Workbook load_workbook(const std::string &path) {
    if (!fs::exists(path)) throw WorkbookError(fmt::format("workbook '{}' not found", path));

    ZipArchive zip(path);
    const std::vector<std::string> strings = load_shared_strings(zip);
    const std::vector<CellStyle> styles = load_styles(zip);

    std::map<std::string, std::string> rel_targets;
    {
        tinyxml2::XMLDocument rels;
        zip.parse("xl/_rels/workbook.xml.rels", rels);
        for_each_child(rels.RootElement(), "Relationship", [&](const XMLElement *rel) {
            rel_targets[attr(rel, "Id")] = resolve_target(attr(rel, "Target"));
        });
    }

    tinyxml2::XMLDocument wbdoc;
    zip.parse("xl/workbook.xml", wbdoc);

    Workbook book;
    if (const XMLElement *pr = child(wbdoc.RootElement(), "workbookPr")) book.codeName = attr(pr, "codeName");
    for_each_child(child(wbdoc.RootElement(), "sheets"), "sheet", [&](const XMLElement *el) {
        const std::string name = attr(el, "name");
        auto target = rel_targets.find(attr(el, "id"));
        if (target == rel_targets.end()) {
            throw WorkbookError(fmt::format("workbook '{}' sheet '{}' has no relationship", path, name));
        }
        // Chartsheets and dialog sheets carry no cell data.
        if (target->second.find("worksheets/") == std::string::npos) return;
        book.sheets.emplace_back(name);
        load_sheet(zip, target->second, book.sheets.back(), strings, styles);
    });

    if (book.sheets.empty()) throw WorkbookError(fmt::format("workbook '{}' has no worksheets", path));

    if (zip.contains("xl/vbaProject.bin")) book.vbaProject = zip.read("xl/vbaProject.bin");
    return book;
}

} // namespace excel
