#ifndef FOLIO_MANIFEST_H
#define FOLIO_MANIFEST_H

#include "folio/assembler.h"

namespace folio {
namespace chapters {

// The compiled-in document, in reading order.
const Manifest& manifest();

}  // namespace chapters
}  // namespace folio

#endif // FOLIO_MANIFEST_H
