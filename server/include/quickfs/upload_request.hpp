/*
 * 설명: HTTP 요청 타깃의 쿼리 문자열을 해석하고 업로드 메타데이터를 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/upload_request_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "quickfs/session.hpp"

namespace quickfs {

struct RequestTarget {
  std::string path;
  std::string query;
};

RequestTarget SplitTarget(std::string_view target);

// 퍼센트 인코딩과 '+'를 복원한다. 잘못된 이스케이프는 그대로 둔다.
std::string PercentDecode(std::string_view value);

std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query);

// 부호 없는 10진수만 허용한다.
std::optional<std::int64_t> ParseNonNegativeInt(std::string_view value);

struct UploadRequestError {
  std::string code;
  std::string message;
};

// 실패하면 nullopt를 반환하고 error에 원인을 채운다.
std::optional<FileMetadata> ParseUploadQuery(std::string_view query, UploadRequestError& error);

}  // namespace quickfs
