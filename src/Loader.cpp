#include "Loader.hpp"
#include "Errors.hpp"
#include <utility>

namespace sqlctx {

ColumnLoader::ColumnLoader(std::string column)
    : m_column(std::move(column)) {
}

ColumnLoader::ColumnLoader(size_t index)
    : m_column(index) {
}

std::any ColumnLoader::load(const Row& row) const {
    if (const auto* name = std::get_if<std::string>(&m_column)) {
        return row.at(*name);
    }
    return row.at(std::get<size_t>(m_column));
}

CallableLoader::CallableLoader(Function fn)
    : m_fn(std::move(fn)) {
    if (!m_fn) {
        throw InterfaceError("CallableLoader requires a function");
    }
}

std::any CallableLoader::load(const Row& row) const {
    return m_fn(row);
}

TupleLoader::TupleLoader(std::vector<LoaderPtr> loaders)
    : m_loaders(std::move(loaders)) {
}

std::any TupleLoader::load(const Row& row) const {
    std::vector<std::any> result;
    result.reserve(m_loaders.size());
    for (const auto& loader : m_loaders) {
        result.push_back(loader ? loader->load(row) : std::any(row));
    }
    return result;
}

ValueLoader::ValueLoader(std::any value)
    : m_value(std::move(value)) {
}

std::any ValueLoader::load(const Row&) const {
    return m_value;
}

}  // namespace sqlctx
