// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./strand-base.h"


thread_local std::shared_ptr<Strand_base> Strand_base::current__;
