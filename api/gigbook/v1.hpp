#pragma once

#include "gigbook/v1/note.pb.h"
#include "gigbook/v1/setlist.pb.h"
#include "gigbook/v1/venue.pb.h"
#include "gigbook/v1/contact.pb.h"
#include "gigbook/v1/rehearsal.pb.h"
#include "gigbook/v1/performance.pb.h"

#include "gigbook/v1/sync.pb.h"

#include "gigbook/v1/export.pb.h"

namespace gigbook::v1 {
using namespace ::gigbook::models::v1;
using namespace ::gigbook::sync::v1;
using namespace ::gigbook::exchange::v1;
}
