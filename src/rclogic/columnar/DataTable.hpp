#pragma once

#include "rclogic/columnar/BooleanMask.hpp"
#include "rclogic/columnar/RedcapValueArray.hpp"
#include "rclogic/core/ValueFactory.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rclogic {
namespace columnar {

/**
 * @brief 有序、具名、等长的列集合
 *
 * 数据加载器给出的是按行组织的字符串表（首行为表头），
 * 这里转成每列一个 RedcapValueArray，供谓词按列求值。
 */
class DataTable {
public:
    using RawColumn = std::pair<std::string, std::vector<std::string>>;

    DataTable() = default;

    /**
     * @brief 由 (列名, 原始值) 序列构造
     * @throws ConfigException 列名重复
     * @throws ValueMismatchException 列长度不一致
     */
    static DataTable fromColumns(const std::vector<RawColumn>& columns,
                                 const core::ValueFactory& factory = core::ValueFactory::getDefault());

    /**
     * @brief 由按行组织的字符串表构造，首行为表头
     * @throws ValueMismatchException 某行的单元格数与表头不一致
     */
    static DataTable fromRows(const std::vector<std::vector<std::string>>& rows,
                              const core::ValueFactory& factory = core::ValueFactory::getDefault());

    void addColumn(const std::string& name, RedcapValueArray column);

    bool hasColumn(const std::string& name) const;

    /**
     * @brief 获取列，不存在时抛出 UnknownFieldException
     */
    const RedcapValueArray& column(const std::string& name) const;

    /**
     * @brief 获取列，不存在时返回 nullptr
     */
    const RedcapValueArray* findColumn(const std::string& name) const;

    const std::vector<std::string>& columnNames() const noexcept { return names_; }
    size_t rowCount() const noexcept { return row_count_; }
    size_t columnCount() const noexcept { return columns_.size(); }
    bool empty() const noexcept { return columns_.empty(); }

    /**
     * @brief 保留掩码为 true 的行
     */
    DataTable filter(const BooleanMask& mask) const;

    /**
     * @brief 按行号取行，语义同 RedcapValueArray::take（不填充）
     */
    DataTable takeRows(const std::vector<long long>& rows) const;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<RedcapValueArray> columns_;
    size_t row_count_ = 0;
};

}} // namespace rclogic::columnar
