#pragma once

#define NDL_CONFIG_SIZEOF_VOID_P    (8)
#define NDL_CONFIG_DEBUG_MODE       (1)

// debug configs: enable/disable to turn on/off specific debug features
#define NDL_CONFIG_CHECK_HEAP_ADDRESSES                 (1)
#define NDL_CONFIG_PRINT_EACH_INSTRUCTION_ON_EXECUTION  (1)
#define NDL_CONFIG_DUMP_VM_STATE_AFTER_EXECUTION        (0)

// needs-scope snapshots: each rendered argument is truncated to this many chars
#define NDL_CONFIG_SCOPE_SNAPSHOT_MAX_LENGTH            (256)
