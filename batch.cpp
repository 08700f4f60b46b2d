#include "batch.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace credit_monitor {

static const char* ID_COL     = "id";
static const char* LABEL_COL  = "loan_status";
static const char* RENT_FEAT  = "rent_indicator";

std::optional<double> Record::numeric(const std::string& name) const
{
    auto it = num.find(name);
    if (it == num.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> Record::categorical(const std::string& name) const
{
    auto it = cat.find(name);
    if (it == cat.end()) return std::nullopt;
    return it->second;
}

bool Batch::is_validated() const
{
    if (records.empty()) return false;
    return std::all_of(records.begin(), records.end(),
                       [](const Record& r){ return r.loan_status.has_value(); });
}

std::optional<int> parse_loan_status(const json& v)
{
    if (v.is_null()) return std::nullopt;
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        if (s == "Fully Paid")  return LABEL_FULLY_PAID;
        if (s == "Charged Off") return LABEL_CHARGED_OFF;
    }
    auto n = parse_number(v);
    if (!n) return std::nullopt;
    if (*n == 0.0) return LABEL_CHARGED_OFF;
    if (*n == 1.0) return LABEL_FULLY_PAID;
    return std::nullopt;
}

/* ------------------------------------------------------------------ */
static void put_field(Record& r, const std::string& key, const json& v)
{
    if (key == ID_COL) {
        r.id = v.is_string() ? v.get<std::string>() : v.dump();
        if (v.is_number_integer() && !v.is_number_unsigned())
            r.id_value = v.get<long long>();
        else if (v.is_number_unsigned())
            r.id_value = v.get<unsigned long long>();
        else if (v.is_number_float())
            r.id_value = v.get<double>();
        else if (v.is_string())
            r.id_value = v.get<std::string>();
        return;
    }
    if (key == LABEL_COL) {
        r.loan_status = parse_loan_status(v);
        if (!r.loan_status && !v.is_null() &&
            !(v.is_string() && trim(v.get<std::string>()).empty()))
            throw InputError("unrecognised loan_status " + v.dump() +
                             " in record '" + r.id + "'");
        return;
    }
    if (v.is_null()) return;
    if (v.is_string()) {
        const std::string& text = v.get_ref<const std::string&>();
        if (trim(text).empty()) return;
        /* "13.5" is a number, "RENT" or "nan" stays categorical */
        auto n = parse_number(text);
        if (n && std::isfinite(*n)) r.num[key] = *n;
        else                        r.cat[key] = text;
        return;
    }
    if (auto n = parse_number(v)) r.num[key] = *n;
}

Batch batch_from_json(const json& records)
{
    if (!records.is_array())
        throw InputError("batch must be a JSON array of objects");

    Batch b;
    b.records.reserve(records.size());
    for (const auto& obj : records) {
        if (!obj.is_object())
            throw InputError("batch entry is not an object: " + obj.dump());
        Record r;
        /* id first so later errors can name the record */
        if (obj.contains(ID_COL)) put_field(r, ID_COL, obj[ID_COL]);
        for (auto it = obj.begin(); it != obj.end(); ++it)
            if (it.key() != ID_COL) put_field(r, it.key(), it.value());
        b.records.push_back(std::move(r));
    }
    return b;
}

/* ---------- CSV -------------------------------------------------- */
static std::vector<std::string> split_csv_line(const std::string& line)
{
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') { cur += '"'; ++i; }
            else if (c == '"') quoted = false;
            else               cur += c;
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(cur); cur.clear();
        } else if (c != '\r') {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

Batch load_batch_csv(const std::string& path)
{
    std::ifstream fin(path);
    if (!fin) throw InputError("cannot open " + path);

    std::string line;
    if (!std::getline(fin, line)) throw InputError("empty csv: " + path);
    std::vector<std::string> header = split_csv_line(line);
    for (auto& h : header) h = trim(h);

    Batch b;
    size_t line_no = 1;
    while (std::getline(fin, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto cells = split_csv_line(line);
        if (cells.size() != header.size())
            throw InputError(path + ":" + std::to_string(line_no) + ": expected " +
                             std::to_string(header.size()) + " cells, got " +
                             std::to_string(cells.size()));

        json obj = json::object();
        for (size_t c = 0; c < header.size(); ++c) {
            const std::string cell = trim(cells[c]);
            if (cell.empty()) continue;
            if (header[c] == ID_COL || header[c] == LABEL_COL) { obj[header[c]] = cell; continue; }
            auto n = parse_number(cell);
            if (n) obj[header[c]] = *n;
            else   obj[header[c]] = cell;
        }
        Batch one = batch_from_json(json::array({obj}));
        b.records.push_back(std::move(one.records.front()));
    }
    logI("loaded " + std::to_string(b.size()) + " records from " + path);
    return b;
}

Batch load_batch(const std::string& path)
{
    if (has_ext(path, ".json")) {
        json j;
        try {
            j = json::parse(read_file(path));
        } catch (const json::parse_error& e) {
            throw InputError(path + ": " + e.what());
        }
        Batch b = batch_from_json(j);
        logI("loaded " + std::to_string(b.size()) + " records from " + path);
        return b;
    }
    return load_batch_csv(path);
}

/* ---------- Feature Deriver -------------------------------------- */
Batch derive_features(const Batch& in,
                      const std::string& housing_column,
                      const std::string& rent_value)
{
    Batch out = in;
    for (auto& r : out.records) {
        auto h = r.categorical(housing_column);
        r.rent_indicator = (h && *h == rent_value) ? 1 : 0;
        r.num[RENT_FEAT] = r.rent_indicator;
    }
    return out;
}

} // namespace credit_monitor
