// src/sim/field_visitor.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sim {

/**
 * LambdaVisitor - Visitor over named result fields
 *
 * Lets exporters (CSV, InfluxDB) enumerate a step record without
 * field-by-field mapping:
 *
 *   auto v = make_visitor([](const char* name, double value) { ... });
 *   results.accept_step(k, v);
 *
 * All numeric types are converted to double.
 */
template<typename Lambda>
class LambdaVisitor {
public:
    explicit LambdaVisitor(Lambda&& lambda) : lambda_(std::forward<Lambda>(lambda)) {}

    template<typename T>
    void visit(const char* name, T value) {
        lambda_(name, static_cast<double>(value));
    }

private:
    Lambda lambda_;
};

template<typename Lambda>
LambdaVisitor<Lambda> make_visitor(Lambda&& lambda) {
    return LambdaVisitor<Lambda>(std::forward<Lambda>(lambda));
}

/**
 * Collect the field names of a record type in visit order.
 */
template<typename Record>
std::vector<std::string> field_names(const Record& record, size_t k) {
    std::vector<std::string> names;
    auto v = make_visitor([&names](const char* name, double) { names.emplace_back(name); });
    record.accept_step(k, v);
    return names;
}

} // namespace sim
