#ifndef __SSP_SITE_ID_SOURCE__
#define __SSP_SITE_ID_SOURCE__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Supplies the identifier a replica stamps on its operations and
 * characters.
 */
class SiteIdSource {
 public:
  virtual ~SiteIdSource() {}
  virtual string newSiteId() = 0;
};

/** @brief Random UUIDv4 site identifiers. */
class UuidSiteIdSource : public SiteIdSource {
 public:
  virtual ~UuidSiteIdSource() {}
  virtual string newSiteId() { return sole::uuid4().str(); }
};

/** @brief Always hands out the same identifier. */
class FixedSiteIdSource : public SiteIdSource {
 public:
  explicit FixedSiteIdSource(const string& _siteId) : siteId(_siteId) {}
  virtual ~FixedSiteIdSource() {}
  virtual string newSiteId() { return siteId; }

 protected:
  string siteId;
};
}  // namespace ssp

#endif  // __SSP_SITE_ID_SOURCE__
