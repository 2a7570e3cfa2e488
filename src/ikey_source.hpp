#pragma once
/*
 * IKeySource
 *
 * Purpose: blocking "read next key" collaborator used by the input feeder.
 * Contract: read_key must return Stopped promptly once `st` is requested.
 */
#include <stop_token>
#include "error.hpp"
#include "key.hpp"

enum class KeyRead { Key, Stopped, Failed };

class IKeySource {
public:
  virtual ~IKeySource() = default;
  virtual KeyRead read_key(std::stop_token st, KeyMsg& out, Error& err) = 0;
};
