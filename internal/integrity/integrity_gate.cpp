#include "integrity_gate.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <mutex>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace auklet::integrity {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

std::string ToHex(const unsigned char* data, unsigned int size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

// response body is not inspected
size_t DiscardBody(char*, size_t size, size_t nmemb, void*) {
  return size * nmemb;
}

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string JoinUrl(std::string base, const std::string& digest) {
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/check_releases/" + digest;
}

} // namespace

std::string ComputeDigest(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::IntegrityError("cannot open executable: " + path);
  }

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw util::IntegrityError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha512_224(), nullptr) != 1) {
    throw util::IntegrityError("EVP_DigestInit_ex failed");
  }

  std::array<char, 64 * 1024> buf{};
  while (in) {
    in.read(buf.data(), buf.size());
    const auto n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
      throw util::IntegrityError("EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) {
    throw util::IntegrityError("read failed: " + path);
  }

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
    throw util::IntegrityError("EVP_DigestFinal_ex failed");
  }
  return ToHex(out, out_len);
}

IntegrityGate::IntegrityGate(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

bool IntegrityGate::IsRecognized(const std::string& digest) const {
  EnsureCurlInitialized();

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::IntegrityError("curl_easy_init failed");
  }

  const std::string url = JoinUrl(base_url_, digest);
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, DiscardBody);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw util::IntegrityError("release check request failed: " + std::string(curl_easy_strerror(rc)));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  AUKLET_LOG_DEBUG("release check answered", {observability::StringField("url", url), observability::IntField("status", status)});

  switch (status) {
  case 200:
    return true;
  case 404:
    return false;
  default:
    throw util::IntegrityError("unexpected release check status: " + std::to_string(status));
  }
}

} // namespace auklet::integrity
