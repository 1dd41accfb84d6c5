#pragma once

/**
 * @file Loader.hpp
 * @brief Row mapping collaborators used through ExecutionOptions.
 *
 * A loader turns one result Row into an application object. The connection
 * layer only decides *whether* a loader applies (see resolveLoader); what a
 * loader produces is up to the loader. Results travel as std::any and are
 * cast back to the type requested by Connection::allAs<T>() and friends.
 */

#include "Errors.hpp"
#include "Value.hpp"
#include <any>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqlctx {

class Loader {
public:
    virtual ~Loader() = default;

    virtual std::any load(const Row& row) const = 0;
};

using LoaderPtr = std::shared_ptr<const Loader>;

// Yields a single column as a Value
class ColumnLoader : public Loader {
public:
    explicit ColumnLoader(std::string column);
    explicit ColumnLoader(size_t index);

    std::any load(const Row& row) const override;

private:
    std::variant<std::string, size_t> m_column;
};

// Calls a function for each row
class CallableLoader : public Loader {
public:
    using Function = std::function<std::any(const Row&)>;

    explicit CallableLoader(Function fn);

    std::any load(const Row& row) const override;

private:
    Function m_fn;
};

// Runs nested loaders on the same row, yields std::vector<std::any>
class TupleLoader : public Loader {
public:
    explicit TupleLoader(std::vector<LoaderPtr> loaders);

    std::any load(const Row& row) const override;

private:
    std::vector<LoaderPtr> m_loaders;
};

// Ignores the row and yields a literal
class ValueLoader : public Loader {
public:
    explicit ValueLoader(std::any value);

    std::any load(const Row& row) const override;

private:
    std::any m_value;
};

/**
 * @brief Builds Model instances with the static factory `Model::fromRow(const Row&)`.
 *
 * It is the caller's responsibility to select every column the model reads.
 */
template <typename Model>
class ModelLoader : public Loader {
public:
    std::any load(const Row& row) const override {
        return Model::fromRow(row);
    }
};

template <typename Model>
LoaderPtr modelLoader() {
    return std::make_shared<ModelLoader<Model>>();
}

/**
 * @brief Apply `loader` to `row` and cast the outcome to T.
 *
 * Without a loader the row itself is the outcome, which only fits T = Row.
 * @throws InterfaceError when the outcome is not a T.
 */
template <typename T>
T loadAs(const Row& row, const LoaderPtr& loader) {
    if (!loader) {
        if constexpr (std::is_same_v<T, Row>) {
            return row;
        } else {
            throw InterfaceError("No loader configured to turn rows into the requested type");
        }
    }
    std::any loaded = loader->load(row);
    if (auto* value = std::any_cast<T>(&loaded)) {
        return std::move(*value);
    }
    throw InterfaceError(std::string("Loader produced ") + loaded.type().name() +
                         " instead of the requested type");
}

}  // namespace sqlctx
