#ifndef BIRCH_BIRCH_H
#define BIRCH_BIRCH_H

#include "database.h"
#include "memory_store.h"

#endif // BIRCH_BIRCH_H
