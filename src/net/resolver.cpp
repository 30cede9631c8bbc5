// ==============================================================================
// resolver.cpp - A-записи через libresolv
// ==============================================================================
//
// Состояние резолвера (res_state) создаётся на каждый запрос: res_nquery
// с отдельным состоянием потокобезопасен, глобальный _res - нет.
//
// ==============================================================================

#include "domaindump/resolver.hpp"

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <resolv.h>

#include <array>
#include <cstring>
#include <utility>

namespace domaindump::resolver {

namespace {

// Ответ на A-запрос с запасом помещается в 4 КБ
constexpr int ANSWER_BUFFER_SIZE = 4096;

// Первая A-запись секции ответа; пусто если A-записей нет
std::string first_a_record(const unsigned char* answer, int length) {
    ns_msg msg;
    if (ns_initparse(answer, length, &msg) != 0) {
        return {};
    }

    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) != 0) {
            continue;
        }
        if (ns_rr_type(rr) != ns_t_a || ns_rr_rdlen(rr) != 4) {
            continue;
        }
        char text[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, ns_rr_rdata(rr), text, sizeof(text)) != nullptr) {
            return text;
        }
    }
    return {};
}

}  // anonymous namespace

std::string ipv4_value(const ResolveResult& result) {
    switch (result.status) {
    case ResolveStatus::Ok:
        return result.address;
    case ResolveStatus::NxDomain:
        return SENTINEL_NXDOMAIN;
    case ResolveStatus::Timeout:
        return SENTINEL_TIMEOUT;
    }
    return SENTINEL_TIMEOUT;
}

DnsResolver::DnsResolver(DnsOptions options) : options_(std::move(options)) {
    if (!options_.server.empty()) {
        in_addr addr{};
        if (inet_pton(AF_INET, options_.server.c_str(), &addr) != 1) {
            throw ResolverError("invalid DNS server address '" + options_.server +
                                "' (expected IPv4)");
        }
    }
    if (options_.timeout_seconds <= 0) {
        throw ResolverError("DNS timeout must be positive");
    }
}

ResolveResult DnsResolver::resolve_a(const std::string& host) {
    struct __res_state state;
    std::memset(&state, 0, sizeof(state));
    if (res_ninit(&state) != 0) {
        return {ResolveStatus::Timeout, {}};
    }

    state.retrans = options_.timeout_seconds;
    state.retry = 1;

    if (!options_.server.empty()) {
        sockaddr_in server{};
        server.sin_family = AF_INET;
        server.sin_port = htons(NS_DEFAULTPORT);
        inet_pton(AF_INET, options_.server.c_str(), &server.sin_addr);
        state.nscount = 1;
        state.nsaddr_list[0] = server;
    }

    std::array<unsigned char, ANSWER_BUFFER_SIZE> answer{};
    int length = res_nquery(&state, host.c_str(), ns_c_in, ns_t_a, answer.data(),
                            static_cast<int>(answer.size()));

    ResolveResult result;
    if (length < 0) {
        int herr = state.res_h_errno;
        result.status = (herr == HOST_NOT_FOUND || herr == NO_DATA) ? ResolveStatus::NxDomain
                                                                    : ResolveStatus::Timeout;
    } else {
        std::string address = first_a_record(answer.data(), length);
        if (address.empty()) {
            result.status = ResolveStatus::NxDomain;
        } else {
            result.status = ResolveStatus::Ok;
            result.address = std::move(address);
        }
    }

    res_nclose(&state);
    return result;
}

}  // namespace domaindump::resolver
