#pragma once

#include <string>

namespace buildq::util {

/*
  Job identifiers.

  Derived from the wall clock in nanoseconds. Every id handed out is strictly
  greater than the previous one, so two jobs created in the same clock tick
  still get distinct, creation-ordered ids.
*/
std::string NextJobId();

} // namespace buildq::util
