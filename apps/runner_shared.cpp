#include "runner_shared.hpp"

#include "radbatch/core/errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace radbatch::runner {

namespace fs = std::filesystem;

std::string format_duration(double seconds) {
  std::ostringstream oss;
  if (seconds < 60.0) {
    oss << std::fixed << std::setprecision(1) << seconds << "s";
    return oss.str();
  }
  const long total = static_cast<long>(seconds + 0.5);
  const long h = total / 3600;
  const long m = (total % 3600) / 60;
  const long s = total % 60;
  if (h > 0) {
    oss << h << "h ";
  }
  oss << m << "m " << s << "s";
  return oss.str();
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

static fs::path make_run_dir(const config::Config &cfg, const std::string &run_id) {
  fs::path dir = fs::path(cfg.paths.logs_dir) / run_id;
  fs::create_directories(dir);
  return dir;
}

RunLog::RunLog(const config::Config &cfg, const std::string &run_id)
    : dir_(make_run_dir(cfg, run_id)),
      file_(dir_ / "run_events.jsonl"),
      tee_(std::cout.rdbuf(), file_.rdbuf()),
      out_(&tee_) {
  if (!file_) {
    throw IOError("Cannot create event log in " + dir_.string());
  }
  cfg.save(dir_ / "config.yaml");
}

} // namespace radbatch::runner
