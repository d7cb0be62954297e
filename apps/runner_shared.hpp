#pragma once

#include "radbatch/config/configuration.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <streambuf>
#include <string>

namespace radbatch::runner {

std::string format_duration(double seconds);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Per-run log directory: <logs_dir>/<run_id>/ holding the effective config
// and run_events.jsonl. Events are mirrored to stdout.
class RunLog {
public:
  RunLog(const config::Config &cfg, const std::string &run_id);
  RunLog(const RunLog &) = delete;
  RunLog &operator=(const RunLog &) = delete;

  std::ostream &events() { return out_; }
  const std::filesystem::path &dir() const { return dir_; }

private:
  std::filesystem::path dir_;
  std::ofstream file_;
  TeeBuf tee_;
  std::ostream out_;
};

} // namespace radbatch::runner
