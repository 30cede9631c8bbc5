// ==============================================================================
// ldap_directory.cpp - DirectorySource поверх OpenLDAP (libldap)
// ==============================================================================
//
// Соединение: ldap_initialize + LDAPv3, referrals выключены (AD отдаёт
// referral'ы на соседние разделы, которые нам не нужны), simple bind.
//
// Поиск: постраничный (RFC 2696, LDAP_CONTROL_PAGEDRESULTS). Страницы
// запрашиваются до пустого cookie; все атрибуты (attrs = NULL).
//
// ==============================================================================

#include "domaindump/directory.hpp"

#include <cstdio>
#include <memory>
#include <utility>

#include <ldap.h>
#include <sys/time.h>

namespace domaindump::directory {

namespace {

struct MessageDeleter {
    void operator()(LDAPMessage* msg) const {
        if (msg != nullptr) {
            ldap_msgfree(msg);
        }
    }
};

using MessagePtr = std::unique_ptr<LDAPMessage, MessageDeleter>;

struct ControlDeleter {
    void operator()(LDAPControl* ctrl) const {
        if (ctrl != nullptr) {
            ldap_control_free(ctrl);
        }
    }
};

using ControlPtr = std::unique_ptr<LDAPControl, ControlDeleter>;

// Коды, означающие проблему транспорта, а не отказ в доступе
bool is_transport_error(int rc) {
    return rc == LDAP_SERVER_DOWN || rc == LDAP_CONNECT_ERROR || rc == LDAP_TIMEOUT ||
           rc == LDAP_UNAVAILABLE;
}

std::string ldap_message(const std::string& what, int rc) {
    char code[16];
    std::snprintf(code, sizeof(code), "0x%x", static_cast<unsigned int>(rc));
    return what + ": " + ldap_err2string(rc) + " (" + code + ")";
}

timeval make_timeval(int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    return tv;
}

}  // anonymous namespace

struct LdapDirectory::Impl {
    LdapOptions options;
    LDAP* ld = nullptr;

    explicit Impl(LdapOptions opts) : options(std::move(opts)) {}

    ~Impl() { close(); }

    void close() {
        if (ld != nullptr) {
            ldap_unbind_ext_s(ld, nullptr, nullptr);
            ld = nullptr;
        }
    }

    void connect() {
        std::string uri = make_ldap_uri(options.host);
        int rc = ldap_initialize(&ld, uri.c_str());
        if (rc != LDAP_SUCCESS) {
            ld = nullptr;
            throw DirectoryError(ErrorKind::Connection,
                                 ldap_message("cannot initialize " + uri, rc));
        }

        int version = LDAP_VERSION3;
        ldap_set_option(ld, LDAP_OPT_PROTOCOL_VERSION, &version);
        ldap_set_option(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);
        timeval tv = make_timeval(options.timeout_seconds);
        ldap_set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &tv);

        berval cred{};
        cred.bv_val = const_cast<char*>(options.password.c_str());
        cred.bv_len = options.password.size();

        const char* who = options.user.empty() ? nullptr : options.user.c_str();
        rc = ldap_sasl_bind_s(ld, who, LDAP_SASL_SIMPLE, &cred, nullptr, nullptr, nullptr);
        if (rc != LDAP_SUCCESS) {
            ErrorKind kind = is_transport_error(rc) ? ErrorKind::Connection
                                                    : ErrorKind::Authentication;
            std::string what = options.user.empty() ? "anonymous bind to " + uri
                                                    : "bind as '" + options.user + "' to " + uri;
            throw DirectoryError(kind, ldap_message(what + " failed", rc));
        }
    }

    Entity read_entry(LDAPMessage* entry) {
        Entity entity;
        if (char* dn = ldap_get_dn(ld, entry)) {
            entity.set_dn(dn);
            ldap_memfree(dn);
        }

        BerElement* ber = nullptr;
        for (char* attr = ldap_first_attribute(ld, entry, &ber); attr != nullptr;
             attr = ldap_next_attribute(ld, entry, ber)) {
            std::vector<std::string> raw;
            if (berval** values = ldap_get_values_len(ld, entry, attr)) {
                for (berval** v = values; *v != nullptr; ++v) {
                    raw.emplace_back((*v)->bv_val, (*v)->bv_len);
                }
                ldap_value_free_len(values);
            }
            entity.set(attr, convert_attribute(attr, raw));
            ldap_memfree(attr);
        }
        if (ber != nullptr) {
            ber_free(ber, 0);
        }
        return entity;
    }

    std::vector<Entity> paged_search(const std::string& base, int scope,
                                     const std::string& filter, char** attrs) {
        std::vector<Entity> out;
        berval cookie{};
        cookie.bv_val = nullptr;
        cookie.bv_len = 0;

        auto release_cookie = [&cookie] {
            if (cookie.bv_val != nullptr) {
                ber_memfree(cookie.bv_val);
                cookie.bv_val = nullptr;
                cookie.bv_len = 0;
            }
        };

        do {
            LDAPControl* raw_page = nullptr;
            int rc = ldap_create_page_control(ld, options.page_size,
                                              cookie.bv_val != nullptr ? &cookie : nullptr, 0,
                                              &raw_page);
            ControlPtr page(raw_page);
            if (rc != LDAP_SUCCESS) {
                release_cookie();
                throw DirectoryError(ErrorKind::Search,
                                     ldap_message("cannot create paged results control", rc));
            }

            LDAPControl* server_controls[] = {page.get(), nullptr};
            timeval tv = make_timeval(options.timeout_seconds);
            LDAPMessage* raw_result = nullptr;
            rc = ldap_search_ext_s(ld, base.c_str(), scope, filter.c_str(), attrs, 0,
                                   server_controls, nullptr, &tv, LDAP_NO_LIMIT, &raw_result);
            MessagePtr result(raw_result);
            if (rc != LDAP_SUCCESS) {
                release_cookie();
                ErrorKind kind = is_transport_error(rc) ? ErrorKind::Connection : ErrorKind::Search;
                throw DirectoryError(kind, ldap_message("search '" + filter + "' under '" +
                                                            base + "' failed",
                                                        rc));
            }

            for (LDAPMessage* entry = ldap_first_entry(ld, result.get()); entry != nullptr;
                 entry = ldap_next_entry(ld, entry)) {
                out.push_back(read_entry(entry));
            }

            int errcode = LDAP_SUCCESS;
            LDAPControl** returned = nullptr;
            rc = ldap_parse_result(ld, result.get(), &errcode, nullptr, nullptr, nullptr,
                                   &returned, 0);
            if (rc != LDAP_SUCCESS || errcode != LDAP_SUCCESS) {
                if (returned != nullptr) {
                    ldap_controls_free(returned);
                }
                release_cookie();
                int code = rc != LDAP_SUCCESS ? rc : errcode;
                throw DirectoryError(ErrorKind::Search,
                                     ldap_message("search '" + filter + "' returned an error", code));
            }

            release_cookie();
            if (returned != nullptr) {
                LDAPControl* response =
                    ldap_control_find(LDAP_CONTROL_PAGEDRESULTS, returned, nullptr);
                if (response != nullptr) {
                    ber_int_t estimate = 0;
                    rc = ldap_parse_pageresponse_control(ld, response, &estimate, &cookie);
                    if (rc != LDAP_SUCCESS) {
                        ldap_controls_free(returned);
                        release_cookie();
                        throw DirectoryError(
                            ErrorKind::Search,
                            ldap_message("cannot parse paged results response", rc));
                    }
                }
                ldap_controls_free(returned);
            }
        } while (cookie.bv_val != nullptr && cookie.bv_len > 0);

        release_cookie();
        return out;
    }
};

LdapDirectory::LdapDirectory(LdapOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
    impl_->connect();
}

LdapDirectory::~LdapDirectory() = default;

std::string LdapDirectory::default_naming_context() {
    char attr_name[] = "defaultNamingContext";
    char* attrs[] = {attr_name, nullptr};

    timeval tv = make_timeval(impl_->options.timeout_seconds);
    LDAPMessage* raw_result = nullptr;
    int rc = ldap_search_ext_s(impl_->ld, "", LDAP_SCOPE_BASE, "(objectClass=*)", attrs, 0,
                               nullptr, nullptr, &tv, LDAP_NO_LIMIT, &raw_result);
    MessagePtr result(raw_result);
    if (rc != LDAP_SUCCESS) {
        ErrorKind kind = is_transport_error(rc) ? ErrorKind::Connection : ErrorKind::Search;
        throw DirectoryError(kind, ldap_message("cannot read RootDSE", rc));
    }

    LDAPMessage* entry = ldap_first_entry(impl_->ld, result.get());
    if (entry != nullptr) {
        Entity root = impl_->read_entry(entry);
        if (auto nc = root.first_string("defaultNamingContext")) {
            return *nc;
        }
    }
    throw DirectoryError(ErrorKind::Search, "RootDSE has no defaultNamingContext");
}

std::vector<Entity> LdapDirectory::search(const std::string& base, const std::string& filter) {
    return impl_->paged_search(base, LDAP_SCOPE_SUBTREE, filter, nullptr);
}

}  // namespace domaindump::directory
