// ==============================================================================
// domaindump/resolver.hpp - Разрешение имён хостов (A-записи)
// ==============================================================================
//
// Назначение:
// - HostResolver: абстрактный "hostname -> IPv4 или типизированный отказ"
// - DnsResolver: реализация поверх libresolv (res_nquery)
// - Строки-заменители ошибок для атрибута IPv4
//
// Отказ разрешения никогда не прерывает прогон: вызывающий подставляет
// sentinel-строку вместо адреса.
//
// ==============================================================================

#ifndef DOMAINDUMP_RESOLVER_HPP
#define DOMAINDUMP_RESOLVER_HPP

#include <stdexcept>
#include <string>

namespace domaindump::resolver {

enum class ResolveStatus {
    Ok,
    NxDomain,  // имени нет, либо у имени нет A-записей
    Timeout    // любой другой отказ (таймаут, SERVFAIL, сеть)
};

struct ResolveResult {
    ResolveStatus status = ResolveStatus::Timeout;
    std::string address;  // только при Ok

    bool ok() const { return status == ResolveStatus::Ok; }
};

/// Значение атрибута IPv4 для записи без dNSHostName
constexpr const char* SENTINEL_NOHOSTNAME = "error.NOHOSTNAME";
constexpr const char* SENTINEL_NXDOMAIN = "error.NXDOMAIN";
constexpr const char* SENTINEL_TIMEOUT = "error.TIMEOUT";

/// Значение атрибута IPv4 по результату: адрес или sentinel
std::string ipv4_value(const ResolveResult& result);

class HostResolver {
public:
    virtual ~HostResolver() = default;

    /// Первая A-запись имени. Должен быть безопасен для вызова из
    /// нескольких потоков одновременно.
    virtual ResolveResult resolve_a(const std::string& host) = 0;
};

/// Неверная конфигурация резолвера (адрес DNS-сервера)
class ResolverError : public std::runtime_error {
public:
    explicit ResolverError(const std::string& message) : std::runtime_error(message) {}
};

struct DnsOptions {
    /// IPv4-адрес DNS-сервера; пусто - системные настройки (/etc/resolv.conf)
    std::string server;

    /// Таймаут одного запроса, секунд
    int timeout_seconds = 2;
};

class DnsResolver : public HostResolver {
public:
    /// @throws ResolverError если server не является IPv4-адресом
    explicit DnsResolver(DnsOptions options);

    ResolveResult resolve_a(const std::string& host) override;

private:
    DnsOptions options_;
};

}  // namespace domaindump::resolver

#endif  // DOMAINDUMP_RESOLVER_HPP
