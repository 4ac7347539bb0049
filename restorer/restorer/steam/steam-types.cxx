#include <restorer/steam/steam-types.hxx>

using namespace std;

namespace restorer
{
  string
  unknown_game_name (uint32_t id)
  {
    return "Unknown Game (" + std::to_string (id) + ")";
  }

  steam_config_paths::
  steam_config_paths (const fs::path& r)
    : steam_root (r),
      steamapps (r / "steamapps"),
      libraryfolders_vdf (steamapps / "libraryfolders.vdf"),
      icons (r / "steam" / "games")
  {
  }

  string
  to_string (eresult r)
  {
    switch (r)
    {
    case eresult::invalid:                  return "Invalid";
    case eresult::ok:                       return "OK";
    case eresult::fail:                     return "Fail";
    case eresult::no_connection:            return "NoConnection";
    case eresult::invalid_password:         return "InvalidPassword";
    case eresult::logged_in_elsewhere:      return "LoggedInElsewhere";
    case eresult::invalid_protocol_version: return "InvalidProtocolVer";
    case eresult::invalid_param:            return "InvalidParam";
    case eresult::busy:                     return "Busy";
    case eresult::invalid_state:            return "InvalidState";
    case eresult::access_denied:            return "AccessDenied";
    case eresult::timeout:                  return "Timeout";
    case eresult::banned:                   return "Banned";
    case eresult::account_not_found:        return "AccountNotFound";
    case eresult::service_unavailable:      return "ServiceUnavailable";
    case eresult::not_logged_on:            return "NotLoggedOn";
    case eresult::expired:                  return "Expired";
    case eresult::account_disabled:         return "AccountDisabled";
    case eresult::try_another_cm:           return "TryAnotherCM";
    case eresult::account_logon_denied:     return "AccountLogonDenied";
    case eresult::invalid_login_auth_code:  return "InvalidLoginAuthCode";
    case eresult::rate_limit_exceeded:      return "RateLimitExceeded";
    case eresult::account_login_denied_need_two_factor:
      return "AccountLoginDeniedNeedTwoFactor";
    case eresult::two_factor_code_mismatch: return "TwoFactorCodeMismatch";
    }

    return "EResult(" + std::to_string (static_cast<int32_t> (r)) + ")";
  }
}
