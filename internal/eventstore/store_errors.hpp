#pragma once

#include <exception>
#include <string>
#include <utility>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace payday::eventstore {

inline void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::StorageError(prefix + ": " + db::ToString(result.code) + ": " + result.message);
  }
}

// Runs a repository call, turning backend exceptions into util::StorageError.
template <typename Fn>
auto GuardStorage(const std::string& what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StorageError&) {
    throw;
  } catch (const util::ConcurrencyConflict&) {
    throw;
  } catch (const util::AlreadyExists&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageError(what + ": " + e.what());
  }
}

} // namespace payday::eventstore
