//===----------------------------------------------------------------------===//
//
// Part of the Kestrel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container
//          used by the IR reader, the translator facade, and the CLI.
// Key invariants: An Expected holds exactly one of a value or an error.
// Ownership/Lifetime: Expected owns both its value and its error payload.
// Links: src/support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace kestrel::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with an error payload.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload; defaults to the shared diagnostic record.
/// @note Mirrors a subset of std::expected for tool-only usage.
template <class T, class E = Diag> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to E to
    ///          avoid colliding with the error constructor below.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for operations with no success payload.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the error describing the failure.
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @param sm Optional source manager to resolve file paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace kestrel::support
