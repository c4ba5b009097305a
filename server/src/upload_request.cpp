/*
 * 설명: 요청 타깃 분리, 쿼리 파라미터 디코딩, 업로드 메타데이터 검증을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/upload_request_test.cpp
 */
#include "quickfs/upload_request.hpp"

#include <cctype>
#include <limits>

namespace quickfs {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string RequiredParam(const std::unordered_map<std::string, std::string>& params, const char* key) {
  auto it = params.find(key);
  return it == params.end() ? std::string{} : it->second;
}
}  // namespace

RequestTarget SplitTarget(std::string_view target) {
  RequestTarget result;
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) {
    result.path = std::string(target);
    return result;
  }
  result.path = std::string(target.substr(0, qpos));
  result.query = std::string(target.substr(qpos + 1));
  return result;
}

std::string PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size()) {
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi < 0 || lo < 0) {
        out.push_back(c);
        continue;
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string_view::npos) {
      // 같은 키가 반복되면 첫 값을 쓴다.
      params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
    } else if (!pair.empty()) {
      params.emplace(PercentDecode(pair), std::string{});
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::int64_t> ParseNonNegativeInt(std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::int64_t result = 0;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    int digit = c - '0';
    if (result > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    result = result * 10 + digit;
  }
  return result;
}

std::optional<FileMetadata> ParseUploadQuery(std::string_view query, UploadRequestError& error) {
  auto params = ParseQueryParams(query);
  FileMetadata meta;
  meta.filename = RequiredParam(params, "filename");
  meta.filetype = RequiredParam(params, "filetype");
  auto filesize = RequiredParam(params, "filesize");
  if (meta.filename.empty() || meta.filetype.empty() || filesize.empty()) {
    error = {"bad_request", "필수 쿼리 파라미터가 없습니다: filename, filetype, filesize"};
    return std::nullopt;
  }
  auto parsed = ParseNonNegativeInt(filesize);
  if (!parsed) {
    error = {"invalid_filesize", "filesize 값이 올바르지 않습니다"};
    return std::nullopt;
  }
  meta.filesize = *parsed;
  return meta;
}

}  // namespace quickfs
