#include "rclogic/columnar/DataTable.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace columnar {

DataTable DataTable::fromColumns(const std::vector<RawColumn>& columns,
                                 const core::ValueFactory& factory) {
    DataTable table;
    for (const auto& [name, raw_values] : columns) {
        table.addColumn(name, factory.makeArray(raw_values));
    }
    COLUMNAR_DEBUG("DataTable built from columns: {} column(s) x {} row(s)",
                   table.columnCount(), table.rowCount());
    return table;
}

DataTable DataTable::fromRows(const std::vector<std::vector<std::string>>& rows,
                              const core::ValueFactory& factory) {
    if (rows.empty()) {
        return DataTable();
    }

    const auto& header = rows.front();
    std::vector<std::vector<std::string>> raw_columns(header.size());
    for (auto& raw_column : raw_columns) {
        raw_column.reserve(rows.size() - 1);
    }

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() != header.size()) {
            core::ValueMismatchException ex(fmt::format("Row {} has a different cell count than the header", r),
                                            row.size(), header.size(), __FILE__, __LINE__);
            ex.addContext(fmt::format("header: {} column(s)", header.size()));
            throw ex;
        }
        for (size_t c = 0; c < row.size(); ++c) {
            raw_columns[c].push_back(row[c]);
        }
    }

    DataTable table;
    for (size_t c = 0; c < header.size(); ++c) {
        table.addColumn(header[c], factory.makeArray(raw_columns[c]));
    }
    COLUMNAR_DEBUG("DataTable built from {} row(s) with {} column(s)",
                   table.rowCount(), table.columnCount());
    return table;
}

void DataTable::addColumn(const std::string& name, RedcapValueArray column) {
    if (index_.count(name) > 0) {
        RCLOGIC_THROW(core::ConfigException, fmt::format("Duplicate column name '{}'", name));
    }
    if (!columns_.empty() && column.size() != row_count_) {
        RCLOGIC_THROW_ARGS(core::ValueMismatchException,
                           fmt::format("Column '{}' length differs from the table", name),
                           column.size(), row_count_);
    }

    row_count_ = column.size();
    index_.emplace(name, columns_.size());
    names_.push_back(name);
    columns_.push_back(std::move(column));
}

bool DataTable::hasColumn(const std::string& name) const {
    return index_.count(name) > 0;
}

const RedcapValueArray& DataTable::column(const std::string& name) const {
    const RedcapValueArray* found = findColumn(name);
    if (!found) {
        RCLOGIC_THROW_ARGS(core::UnknownFieldException, "Column not found in table", name);
    }
    return *found;
}

const RedcapValueArray* DataTable::findColumn(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

DataTable DataTable::filter(const BooleanMask& mask) const {
    if (mask.size() != row_count_) {
        RCLOGIC_THROW_ARGS(core::ValueMismatchException,
                           "Filter mask length differs from the table row count",
                           mask.size(), row_count_);
    }

    const auto selected = maskToIndices(mask);
    std::vector<long long> rows(selected.begin(), selected.end());
    return takeRows(rows);
}

DataTable DataTable::takeRows(const std::vector<long long>& rows) const {
    DataTable result;
    for (size_t c = 0; c < columns_.size(); ++c) {
        result.addColumn(names_[c], columns_[c].take(rows));
    }
    return result;
}

}} // namespace rclogic::columnar
