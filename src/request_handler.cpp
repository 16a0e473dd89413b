/**
 * @file request_handler.cpp
 * @brief Request sequencing and response building implementation
 */

#include "img2reel/request_handler.hpp"

#include <cctype>
#include <utility>

#include <fmt/core.h>

#include "img2reel/config.hpp"
#include "img2reel/logging.hpp"
#include "img2reel/system.hpp"

namespace img2reel {

namespace {

const std::string &field(const FieldMap &fields, const std::string &key) {
  static const std::string empty;
  auto it = fields.find(key);
  return it == fields.end() ? empty : it->second;
}

int field_int(const FieldMap &fields, const std::string &key, int fallback,
              int lo, int hi) {
  return clamp_int(parse_lenient_int(field(fields, key), fallback), lo, hi);
}

} // anonymous namespace

// **---- Parameters ----**

int parse_lenient_int(const std::string &text, int fallback) {
  size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
    ++i;

  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }

  long long value = 0;
  size_t digits = 0;
  for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]));
       ++i, ++digits) {
    if (value < 1000000000LL)
      value = value * 10 + (text[i] - '0');
  }
  if (digits == 0)
    return fallback;
  if (value > 1000000000LL)
    value = 1000000000LL;
  return static_cast<int>(negative ? -value : value);
}

int clamp_int(int value, int lo, int hi) {
  if (value < lo)
    return lo;
  if (value > hi)
    return hi;
  return value;
}

int normalize_dimension(int value) {
  return clamp_int(value, MIN_DIMENSION, MAX_DIMENSION) & ~1;
}

MediaParams resolve_media_params(const FieldMap &fields, int default_width,
                                 int default_height) {
  MediaParams media;
  media.duration_sec = field_int(fields, "duration", DEFAULT_DURATION_SEC,
                                 MIN_DURATION_SEC, MAX_DURATION_SEC);
  media.fps = field_int(fields, "fps", DEFAULT_FPS, MIN_FPS, MAX_FPS);
  media.width =
      normalize_dimension(parse_lenient_int(field(fields, "width"),
                                            default_width));
  media.height =
      normalize_dimension(parse_lenient_int(field(fields, "height"),
                                            default_height));
  return media;
}

int resolve_intro_duration(const FieldMap &fields, int max_intro_sec) {
  return field_int(fields, "intro_duration", DEFAULT_INTRO_DURATION_SEC, 0,
                   max_intro_sec);
}

HandlerOptions HandlerOptions::from_config() {
  HandlerOptions opts;
  opts.default_width = Config::default_width();
  opts.default_height = Config::default_height();
  opts.max_intro_duration_sec = Config::max_intro_duration_sec();
  return opts;
}

// **---- RequestHandler ----**

RequestHandler::RequestHandler(ContentFetcher &fetcher,
                               WorkspaceManager &workspace,
                               EncodeOrchestrator &orchestrator,
                               HandlerOptions options)
    : fetcher_(fetcher), workspace_(workspace), orchestrator_(orchestrator),
      options_(options) {}

nlohmann::json RequestHandler::health_body() { return {{"ok", true}}; }

nlohmann::json RequestHandler::error_body(const std::string &message) {
  return {{"ok", false}, {"error", message}};
}

bool RequestHandler::stage_source(const std::string &tag,
                                  const std::string &url,
                                  const std::optional<UploadedFile> &upload,
                                  const std::string &label, StagedInput &out,
                                  Error &err) {
  bool ok;
  if (!url.empty()) {
    LOG_INFO("{} Fetching {} source ({})", tag, label,
             to_string(fetcher_.options().strategy));
    ok = fetcher_.fetch(url, label, out, err);
  } else {
    LOG_INFO("{} Staging uploaded {} ({} bytes)", tag, upload->filename,
             upload->content.size());
    ok = fetcher_.stage_upload(*upload, label, out, err);
  }
  if (ok) {
    LOG_INFO("{} Staged {} source: {} bytes", tag, label, out.size_bytes);
  }
  return ok;
}

HandlerResponse RequestHandler::handle(const RequestInputs &in) {
  HandlerResponse response;
  StageTimings timings;
  Error err;

  std::string token;
  if (!generate_token(4, token)) {
    response.status = http_status_for(ErrorKind::Internal);
    response.body = error_body("Entropy source unavailable");
    return response;
  }
  const std::string tag = fmt::format("[Req {}]", token);

  const MediaParams media = resolve_media_params(
      in.fields, options_.default_width, options_.default_height);
  const int intro_duration =
      resolve_intro_duration(in.fields, options_.max_intro_duration_sec);

  const std::string &url = field(in.fields, "url");
  const std::string &intro_url = field(in.fields, "intro_url");
  const bool has_intro_source = !intro_url.empty() || in.intro_file;
  const bool use_intro = has_intro_source && intro_duration > 0;

  auto fail = [&](const Error &e) {
    LOG_ERROR("{} Failed ({}): {}", tag, to_string(e.kind), e.message);
    if (!timings.entries().empty()) {
      LOG_INFO("{} Timings: {}", tag, timings.summary());
    }
    response.status = http_status_for(e.kind);
    response.body = error_body(e.message);
    return response;
  };

  // **----- VALIDATE -----**

  if (url.empty() && !in.file) {
    err.set(ErrorKind::ClientInput, "Provide ?url=PNG/JPG or multipart \"file\"");
    return fail(err);
  }
  if (!url.empty() && in.file) {
    err.set(ErrorKind::ClientInput,
            "Provide either ?url or multipart \"file\", not both");
    return fail(err);
  }
  if (!intro_url.empty() && in.intro_file) {
    err.set(ErrorKind::ClientInput,
            "Provide either ?intro_url or multipart \"intro\", not both");
    return fail(err);
  }
  if (use_intro && orchestrator_.profile().kind == ProfileKind::Baseline) {
    err.set(ErrorKind::ClientInput,
            "Intro segments require the compressed encode profile");
    return fail(err);
  }

  /// Upload names are checked before any network or encode work
  ImageType ignored;
  if (in.file &&
      !ContentFetcher::validate_upload_name(in.file->filename, ignored, err)) {
    return fail(err);
  }
  if (use_intro && in.intro_file &&
      !ContentFetcher::validate_upload_name(in.intro_file->filename, ignored,
                                            err)) {
    return fail(err);
  }

  LOG_PHASE("{} image-to-video {}s @ {}fps {}x{}{}", tag, media.duration_sec,
            media.fps, media.width, media.height,
            use_intro ? fmt::format(" intro={}s", intro_duration)
                      : std::string());

  // **----- STAGE -----**

  ReelRequest reel;
  reel.tag = tag;
  reel.media = media;

  std::optional<TempFileGuard> main_guard;
  std::optional<TempFileGuard> intro_guard;

  TIMER_START(fetch);
  if (!stage_source(tag, url, in.file, "src", reel.main, err)) {
    return fail(err);
  }
  main_guard.emplace(workspace_, reel.main.path);

  if (use_intro) {
    StagedInput intro;
    if (!stage_source(tag, intro_url, in.intro_file, "intro", intro, err)) {
      return fail(err);
    }
    intro_guard.emplace(workspace_, intro.path);
    reel.intro = intro;
    reel.intro_duration_sec = intro_duration;
  }
  TIMER_END(timings, fetch);

  // **----- ENCODE + PUBLISH -----**

  VideoArtifact artifact;
  if (!orchestrator_.produce(reel, timings, artifact, err)) {
    return fail(err);
  }

  const std::string public_url =
      fmt::format("{}://{}{}", in.scheme, in.host, artifact.public_path);

  response.status = 200;
  response.body = {{"ok", true},
                   {"id", artifact.id},
                   {"filename", artifact.filename},
                   {"duration", media.duration_sec},
                   {"fps", media.fps},
                   {"width", media.width},
                   {"height", media.height},
                   {"intro_duration", use_intro ? intro_duration : 0},
                   {"profile", to_string(orchestrator_.profile().kind)},
                   {"url", public_url},
                   {"path", artifact.public_path}};

  LOG_INFO("{} Timings: {} (total {})", tag, timings.summary(),
           format_duration_us(timings.total_us()));
  return response;
}

} // namespace img2reel
