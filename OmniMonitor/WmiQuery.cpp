// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// WmiQuery.cpp
// =================================================================
#ifdef _WIN32
#include "WmiQuery.h"

#include <Windows.h>
#include <Wbemidl.h>
#include <comdef.h>
#pragma comment(lib, "wbemuuid.lib")

namespace omnimon {

    namespace {
        std::string bstr_to_str(BSTR bstr) {
            if (!bstr) return "";
            return wide_to_utf8(std::wstring(bstr, SysStringLen(bstr)));
        }
    }

    ComThreadScope::ComThreadScope() {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        owned_ = SUCCEEDED(hr);
        // Already in an STA: COM is usable, but this scope must not uninitialize it
        changedMode_ = hr == RPC_E_CHANGED_MODE;
    }

    ComThreadScope::~ComThreadScope() {
        if (owned_) CoUninitialize();
    }

    std::string wide_to_utf8(const std::wstring& wide) {
        if (wide.empty()) return {};
        int size = WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()),
            nullptr, 0, nullptr, nullptr);
        if (size <= 0) return {};
        std::string out(static_cast<size_t>(size), '\0');
        WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()),
            out.data(), size, nullptr, nullptr);
        return out;
    }

    std::optional<double> WmiRow::number(const std::wstring& field) const {
        auto it = fields.find(field);
        if (it == fields.end()) return std::nullopt;
        if (const double* d = std::get_if<double>(&it->second)) return *d;
        if (const std::string* s = std::get_if<std::string>(&it->second)) {
            try {
                size_t used = 0;
                double parsed = std::stod(*s, &used);
                if (used == s->size()) return parsed;
            }
            catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> WmiRow::text(const std::wstring& field) const {
        auto it = fields.find(field);
        if (it == fields.end()) return std::nullopt;
        if (const std::string* s = std::get_if<std::string>(&it->second)) return *s;
        return std::nullopt;
    }

    WmiSession::~WmiSession() {
        ComThreadScope scope;
        if (pSvc) pSvc->Release();
        if (pLoc) pLoc->Release();
    }

    std::expected<std::unique_ptr<WmiSession>, MonitorError> WmiSession::connect(const std::wstring& wmiNamespace) {
        ComThreadScope scope;
        if (!scope.joined()) {
            return std::unexpected(MonitorError::BackendUnavailable);
        }
        std::unique_ptr<WmiSession> session(new WmiSession());

        HRESULT hr = CoInitializeSecurity(nullptr, -1, nullptr, nullptr, RPC_C_AUTHN_LEVEL_DEFAULT,
            RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE, nullptr);
        if (FAILED(hr) && hr != RPC_E_TOO_LATE) {
            return std::unexpected(MonitorError::AccessDenied);
        }

        hr = CoCreateInstance(CLSID_WbemLocator, 0, CLSCTX_INPROC_SERVER, IID_IWbemLocator,
            reinterpret_cast<LPVOID*>(&session->pLoc));
        if (FAILED(hr)) {
            return std::unexpected(MonitorError::BackendUnavailable);
        }

        hr = session->pLoc->ConnectServer(_bstr_t(wmiNamespace.c_str()), nullptr, nullptr,
            nullptr, 0, nullptr, nullptr, &session->pSvc);
        if (FAILED(hr)) {
            return std::unexpected(hr == WBEM_E_ACCESS_DENIED
                ? MonitorError::AccessDenied : MonitorError::BackendUnavailable);
        }

        hr = CoSetProxyBlanket(session->pSvc, RPC_C_AUTHN_WINNT, RPC_C_AUTHZ_NONE, nullptr,
            RPC_C_AUTHN_LEVEL_CALL, RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE);
        if (FAILED(hr)) {
            return std::unexpected(MonitorError::AccessDenied);
        }

        return session;
    }

    std::expected<std::vector<WmiRow>, MonitorError> WmiSession::query(const std::wstring& wql,
        const std::vector<std::wstring>& properties) const
    {
        ComThreadScope scope;
        IEnumWbemClassObject* pEnum = nullptr;
        HRESULT hr = pSvc->ExecQuery(_bstr_t(L"WQL"), _bstr_t(wql.c_str()),
            WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY, nullptr, &pEnum);
        if (FAILED(hr)) {
            return std::unexpected(hr == WBEM_E_ACCESS_DENIED
                ? MonitorError::AccessDenied : MonitorError::NotFound);
        }

        std::vector<WmiRow> rows;
        IWbemClassObject* pObj = nullptr;
        ULONG ret = 0;
        while (pEnum->Next(WBEM_INFINITE, 1, &pObj, &ret) == S_OK) {
            WmiRow row;
            for (const auto& prop : properties) {
                VARIANT vt;
                VariantInit(&vt);
                if (SUCCEEDED(pObj->Get(prop.c_str(), 0, &vt, nullptr, nullptr))) {
                    switch (vt.vt) {
                    case VT_BSTR: row.fields[prop] = bstr_to_str(vt.bstrVal); break;
                    case VT_R4:   row.fields[prop] = static_cast<double>(vt.fltVal); break;
                    case VT_R8:   row.fields[prop] = vt.dblVal; break;
                    case VT_UI1:  row.fields[prop] = static_cast<double>(vt.bVal); break;
                    case VT_I2:   row.fields[prop] = static_cast<double>(vt.iVal); break;
                    case VT_UI2:  row.fields[prop] = static_cast<double>(vt.uiVal); break;
                    case VT_I4:   row.fields[prop] = static_cast<double>(vt.lVal); break;
                    case VT_UI4:
                    case VT_UINT: row.fields[prop] = static_cast<double>(vt.uintVal); break;
                    case VT_BOOL: row.fields[prop] = vt.boolVal == VARIANT_TRUE ? 1.0 : 0.0; break;
                    default:      row.fields[prop] = std::monostate{}; break;
                    }
                }
                VariantClear(&vt);
            }

            VARIANT vtPath;
            VariantInit(&vtPath);
            if (SUCCEEDED(pObj->Get(L"__PATH", 0, &vtPath, nullptr, nullptr)) && vtPath.vt == VT_BSTR) {
                row.path = bstr_to_str(vtPath.bstrVal);
            }
            VariantClear(&vtPath);

            rows.push_back(std::move(row));
            pObj->Release();
        }
        pEnum->Release();
        return rows;
    }

} // namespace omnimon
#endif // _WIN32
