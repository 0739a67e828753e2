#include "doco/core/http_util.h"

#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <kj/debug.h>
#include <kj/encoding.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace doco::core {

namespace {

constexpr const char* kWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

constexpr const char* kLongWeekdays[] = {"Sunday",   "Monday", "Tuesday", "Wednesday",
                                         "Thursday", "Friday", "Saturday"};

char to_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

bool equals_ignore_case(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (to_lower(a[i]) != to_lower(b[i])) {
      return false;
    }
  }
  return true;
}

kj::Maybe<kj::StringPtr> find_header(const kj::HttpHeaders& headers, kj::StringPtr name) {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr header_name, kj::StringPtr header_value) {
    if (result == kj::none && equals_ignore_case(header_name, name)) {
      result = header_value;
    }
  });
  return result;
}

int64_t unix_seconds(kj::Date date) {
  return (date - kj::UNIX_EPOCH) / kj::SECONDS;
}

kj::String format_http_date(kj::Date date) {
  time_t seconds = static_cast<time_t>(unix_seconds(date));
  std::tm tm{};
  gmtime_r(&seconds, &tm);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT", kWeekdays[tm.tm_wday],
                tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900, tm.tm_hour, tm.tm_min,
                tm.tm_sec);
  return kj::str(buf);
}

kj::Maybe<kj::Date> parse_http_date(kj::StringPtr text) {
  char weekday[10] = {};
  char month_name[4] = {};
  int day = 0, year = 0, hour = 0, minute = 0, second = 0;
  int consumed = -1;
  bool known_weekday = false;

  if (text.size() == 29 && text[3] == ',') {
    // IMF-fixdate: "Sun, 06 Nov 1994 08:49:37 GMT"
    if (std::sscanf(text.cStr(), "%3[A-Za-z], %2d %3[A-Za-z] %4d %2d:%2d:%2d GMT%n", weekday,
                    &day, month_name, &year, &hour, &minute, &second, &consumed) != 7) {
      return kj::none;
    }
    for (auto name : kWeekdays) {
      known_weekday = known_weekday || std::strcmp(name, weekday) == 0;
    }
  } else if (text.findFirst(',') != kj::none) {
    // RFC 850: "Sunday, 06-Nov-94 08:49:37 GMT"
    if (std::sscanf(text.cStr(), "%9[A-Za-z], %2d-%3[A-Za-z]-%2d %2d:%2d:%2d GMT%n", weekday,
                    &day, month_name, &year, &hour, &minute, &second, &consumed) != 7) {
      return kj::none;
    }
    year += year >= 69 ? 1900 : 2000;
    for (auto name : kLongWeekdays) {
      known_weekday = known_weekday || std::strcmp(name, weekday) == 0;
    }
  } else if (text.size() == 24) {
    // asctime: "Sun Nov  6 08:49:37 1994"
    if (std::sscanf(text.cStr(), "%3[A-Za-z] %3[A-Za-z] %2d %2d:%2d:%2d %4d%n", weekday,
                    month_name, &day, &hour, &minute, &second, &year, &consumed) != 7) {
      return kj::none;
    }
    for (auto name : kWeekdays) {
      known_weekday = known_weekday || std::strcmp(name, weekday) == 0;
    }
  }
  if (!known_weekday || consumed != static_cast<int>(text.size())) {
    return kj::none;
  }

  int month = -1;
  for (int i = 0; i < 12; ++i) {
    if (std::strcmp(kMonths[i], month_name) == 0) {
      month = i;
      break;
    }
  }
  if (month < 0 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return kj::none;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  time_t seconds = timegm(&tm);
  return kj::UNIX_EPOCH + static_cast<int64_t>(seconds) * kj::SECONDS;
}

kj::StringPtr status_text(kj::uint status) {
  switch (status) {
  case 200:
    return "OK"_kj;
  case 204:
    return "No Content"_kj;
  case 206:
    return "Partial Content"_kj;
  case 304:
    return "Not Modified"_kj;
  case 400:
    return "Bad Request"_kj;
  case 401:
    return "Unauthorized"_kj;
  case 403:
    return "Forbidden"_kj;
  case 404:
    return "Not Found"_kj;
  case 405:
    return "Method Not Allowed"_kj;
  case 412:
    return "Precondition Failed"_kj;
  case 416:
    return "Range Not Satisfiable"_kj;
  case 500:
    return "Internal Server Error"_kj;
  case 502:
    return "Bad Gateway"_kj;
  case 503:
    return "Service Unavailable"_kj;
  case 504:
    return "Gateway Timeout"_kj;
  default:
    return status < 400 ? "OK"_kj : "Error"_kj;
  }
}

RequestTarget split_request_target(kj::StringPtr url) {
  kj::StringPtr target = url;

  // Absolute-form: skip "scheme://authority".
  KJ_IF_SOME(scheme_end, target.find("://"_kj)) {
    auto after_scheme = target.slice(scheme_end + 3);
    KJ_IF_SOME(slash, after_scheme.findFirst('/')) {
      target = after_scheme.slice(slash);
    } else {
      target = "/"_kj;
    }
  }

  kj::ArrayPtr<const char> raw_path = target.asArray();
  kj::String query = kj::str();
  KJ_IF_SOME(question, target.findFirst('?')) {
    raw_path = target.slice(0, question);
    query = kj::str(target.slice(question + 1));
  }

  auto decoded = kj::decodeUriComponent(raw_path);
  kj::String path;
  if (decoded.hadErrors) {
    path = kj::str(raw_path);
  } else {
    path = kj::mv(decoded);
  }
  if (path.size() == 0) {
    path = kj::str("/");
  }
  return RequestTarget{kj::mv(path), kj::mv(query)};
}

kj::String peer_ip(kj::AsyncIoStream& stream) {
  struct sockaddr_storage addr;
  memset(&addr, 0, sizeof(addr));
  kj::uint length = sizeof(addr);

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               stream.getpeername(reinterpret_cast<struct sockaddr*>(&addr), &length);
             })) {
    KJ_LOG(DBG, "peer address unavailable", exception.getDescription());
    return kj::str();
  }

  char buf[INET6_ADDRSTRLEN] = {};
  if (addr.ss_family == AF_INET) {
    auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
    inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
  } else if (addr.ss_family == AF_INET6) {
    auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
    inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
  } else {
    return kj::str();
  }
  return kj::str(buf);
}

kj::String listen_address(kj::StringPtr address) {
  if (address.startsWith(":")) {
    return kj::str("*", address);
  }
  return kj::str(address);
}

kj::String dial_address(kj::StringPtr address) {
  if (address.startsWith(":")) {
    return kj::str("localhost", address);
  }
  return kj::str(address);
}

} // namespace doco::core
