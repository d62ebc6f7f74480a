// minml/basic/ident.cpp - Identifier intern table
#include "minml/basic/ident.hpp"

#include <cstring>
#include <mutex>
#include <ostream>

namespace minml
{

IdentTable::IdentTable(size_t initial_buffer_size)
: arena_(initial_buffer_size), pool_(&arena_)
{
}

IdentTable & IdentTable::global()
{
  static IdentTable table;
  return table;
}

std::string_view IdentTable::intern(std::string_view text)
{
  {
    const std::shared_lock<std::shared_mutex> lock(mutex_);
    if (const auto it = pool_.find(text); it != pool_.end()) {
      return *it;
    }
  }

  const std::unique_lock<std::shared_mutex> lock(mutex_);

  // Another writer may have inserted it between the two locks.
  if (const auto it = pool_.find(text); it != pool_.end()) {
    return *it;
  }

  char * const ptr = static_cast<char *>(arena_.allocate(text.size() + 1, 1));
  std::memcpy(ptr, text.data(), text.size());
  ptr[text.size()] = '\0';

  const std::string_view stored(ptr, text.size());
  pool_.insert(stored);
  return stored;
}

bool IdentTable::contains(std::string_view text) const
{
  const std::shared_lock<std::shared_mutex> lock(mutex_);
  return pool_.find(text) != pool_.end();
}

size_t IdentTable::size() const
{
  const std::shared_lock<std::shared_mutex> lock(mutex_);
  return pool_.size();
}

Ident Ident::intern(std::string_view text) { return Ident(IdentTable::global().intern(text)); }

std::ostream & operator<<(std::ostream & os, Ident id) { return os << id.str(); }

}  // namespace minml
