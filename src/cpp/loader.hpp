/*
loader.hpp:
    Ordered fallible loaders, e.g. read the constraints from CONTCAR and
    fall back to POSCAR.

structs:
    Loaded<T>: the value of a successful load, or the message of the failure

functions:
    try_load: run one loader, turning its exception into a failed Loaded
    first_success: run loaders in order until one succeeds
*/
#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

template <typename T>
struct Loaded {
    std::optional<T> value;
    std::string error;      // empty on success

    bool ok() const { return value.has_value(); }
};

template <typename T>
using Loader = std::function<T()>;

template <typename T>
Loaded<T> try_load(const Loader<T>& load) {
    Loaded<T> result;
    try {
        result.value = load();
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

/**
 * @brief Tries loaders in order.
 * @return the first success, or the failure of the last loader
 *         ("no loader given" for an empty list).
 */
template <typename T>
Loaded<T> first_success(const std::vector<Loader<T>>& loaders) {
    Loaded<T> result;
    result.error = "no loader given";
    for (const Loader<T>& load : loaders) {
        result = try_load(load);
        if (result.ok()) {
            break;
        }
    }
    return result;
}
