#include "jobkeep_core/async/id_generator.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace jobkeep_core {

namespace {

std::mt19937_64 seeded_engine() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
  return std::mt19937_64(seq);
}

}  // namespace

UuidJobIdGenerator::UuidJobIdGenerator() : engine_(seeded_engine()) {}

JobId UuidJobIdGenerator::next() {
  uint64_t hi = 0;
  uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    hi = engine_();
    lo = engine_();
  }

  // version 4, RFC 4122 variant
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  ss << std::setw(8) << (hi >> 32) << '-';
  ss << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-';
  ss << std::setw(4) << (hi & 0xFFFF) << '-';
  ss << std::setw(4) << (lo >> 48) << '-';
  ss << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return JobId(ss.str());
}

SequentialJobIdGenerator::SequentialJobIdGenerator(std::string prefix)
    : prefix_(std::move(prefix)) {}

JobId SequentialJobIdGenerator::next() {
  auto now = std::chrono::duration_cast<std::chrono::microseconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  uint64_t unique_counter = counter_.fetch_add(1);

  std::stringstream ss;
  ss << prefix_ << "_" << now << "_" << getpid() << "_" << unique_counter;
  return JobId(ss.str());
}

}  // namespace jobkeep_core
