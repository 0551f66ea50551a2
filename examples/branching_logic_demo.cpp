/**
 * @file branching_logic_demo.cpp
 * @brief 分支逻辑翻译演示程序
 *
 * 演示流程：
 * 1. 从按行组织的字符串表（首行表头）构建 DataTable
 * 2. 翻译数据字典中各字段的分支逻辑
 * 3. 对数据表求值，统计每个字段应当出现（需要填写）的记录数
 */

#include "rclogic/RcLogic.hpp"
#include "rclogic/utils/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <map>

using namespace rclogic;

int main() {
    if (!rclogic::initialize("logs/branching_logic_demo.log", true)) {
        return 1;
    }

    std::cout << "RcLogic " << rclogic::getVersion() << " 分支逻辑演示" << std::endl;

    // 缺失数据代码来自项目信息导出
    core::ClassifierConfig config = core::ClassifierConfig::standard();
    config.withMissingCodes(core::ClassifierConfig::parseMissingDataCodes("NA, Not applicable | UNK, Unknown"));
    core::ValueFactory factory(config);

    const std::vector<std::vector<std::string>> rows = {
        {"record_id", "age", "sex", "smoker", "symptoms___1", "symptoms___2", "visit_date"},
        {"1",         "34",  "2",   "1",      "1",            "0",            "2023-04-01"},
        {"2",         "",    "1",   "0",      "0",            "1",            "2023-04-03"},
        {"3",         "67",  "2",   "UNK",    "0",            "0",            ""},
        {"4",         "17",  "1",   "1",      "1",            "1",            "2023-05-12"}
    };

    try {
        auto table = columnar::DataTable::fromRows(rows, factory);
        std::cout << "数据表: " << table.rowCount() << " 行 x " << table.columnCount() << " 列" << std::endl;

        const std::map<std::string, std::string> dictionary = {
            {"pregnant",     "[sex] = '2' AND [age] >= 12"},
            {"pack_years",   "[smoker] = \"1\" and [age] > 18"},
            {"cough_detail", "[symptoms(2)] = '1'"},
            {"any_symptom",  "[symptoms(1)] = '1' OR [symptoms(2)] = '1'"},
            {"not_smoker",   "!([smoker] = '1')"},
            {"broken",       "[age] >="},
            {"record_id",    ""}
        };

        logic::LogicTranslator translator;
        auto batch = translator.translateAll(dictionary);

        std::cout << "\n=== 翻译结果 ===" << std::endl;
        for (const auto& [field, result] : batch.translated) {
            auto mask = logic::evaluate(*result.predicate, table);
            std::cout << std::left << std::setw(14) << field
                      << " 显示 " << columnar::countTrue(mask) << "/" << table.rowCount()
                      << "  " << result.predicate->toString() << std::endl;
        }
        for (const auto& [field, error] : batch.failed) {
            std::cout << std::left << std::setw(14) << field << " 翻译失败: " << error.message << std::endl;
        }
        for (const auto& field : batch.skipped) {
            std::cout << std::left << std::setw(14) << field << " 无分支逻辑" << std::endl;
        }

        // 值语义：原始串优先，数值比较只对数字有效
        std::cout << "\n=== 值语义 ===" << std::endl;
        auto missing = factory.makeValue("");
        auto code = factory.makeValue("UNK");
        std::cout << std::boolalpha
                  << "'' = 0      -> " << (missing == 0) << std::endl
                  << "'' = '0'    -> " << (missing == "0") << std::endl
                  << "'13' < '13.0' -> " << (factory.makeValue("13") < "13.0") << std::endl
                  << "UNK > 5     -> " << (code > 5) << " (" << code.category() << ")" << std::endl;

        auto ages = table.column("age");
        auto next_year = ages.add(core::Operand(1));
        std::cout << "age + 1     -> ";
        for (const auto& raw : next_year.rawStrings()) {
            std::cout << "'" << raw << "' ";
        }
        std::cout << std::endl;

        auto adults = table.filter(translator.evaluate("[age] >= 18", table));
        std::cout << "成年记录: " << adults.rowCount() << std::endl;
    } catch (const core::RcLogicException& e) {
        std::cerr << e.getDetailedMessage() << std::endl;
        rclogic::cleanup();
        return 1;
    }

    rclogic::cleanup();
    return 0;
}
