#include "ScanConfig.h"

// Order matters: the first matching rule wins.
std::vector<ClassificationRule> ScanConfig::default_rules() {
    return {
        {"ssh",         "(?i)(^|/)\\.ssh(/|$)|(^|/)id_(rsa|dsa|ecdsa|ed25519)(\\.pub)?$|(^|/)known_hosts$"},
        {"registry",    "(?i)(^|/)(ntuser|usrclass)\\.dat|/system32/config/"},
        {"credentials", "(?i)(^|/)\\.(aws|docker|kube|gnupg)(/|$)|(^|/)\\.(netrc|git-credentials|pgpass)$|keychains"},
        {"history",     "(?i)_history(\\.txt)?$|(^|/)\\.(lesshst|viminfo|wget-hsts)$|recently-used\\.xbel$|/recent(/|$)|sharedfilelist"},
        {"trash",       "(?i)(^|/)(\\.trash|trash)(/|$)"},
        {"cache",       "(?i)(^|/)\\.?caches?(/|$)|thumbnails|inetcache|thumbcache|(^|/)temp$"},
        {"config",      "(?i)(^|/)\\.config(/|$)|(^|/)\\.[^/]*rc$|\\.(conf|cfg|ini)$|(^|/)\\.profile$"},
    };
}
