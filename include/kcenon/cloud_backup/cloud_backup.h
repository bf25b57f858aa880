/**
 * @file cloud_backup.h
 * @brief Umbrella header for the cloud_backup library
 */

#ifndef KCENON_CLOUD_BACKUP_CLOUD_BACKUP_H
#define KCENON_CLOUD_BACKUP_CLOUD_BACKUP_H

#include "kcenon/cloud_backup/config/backup_config.h"
#include "kcenon/cloud_backup/core/checksum.h"
#include "kcenon/cloud_backup/core/chunk_source.h"
#include "kcenon/cloud_backup/core/chunk_types.h"
#include "kcenon/cloud_backup/core/logging.h"
#include "kcenon/cloud_backup/core/rate_limiter.h"
#include "kcenon/cloud_backup/core/secret.h"
#include "kcenon/cloud_backup/core/types.h"
#include "kcenon/cloud_backup/encryption/gpg_cipher.h"
#include "kcenon/cloud_backup/inventory/inventory_store.h"
#include "kcenon/cloud_backup/pipeline/pipeline_coordinator.h"
#include "kcenon/cloud_backup/restore/restore_script.h"
#include "kcenon/cloud_backup/retention/retention_manager.h"
#include "kcenon/cloud_backup/store/s3_object_store.h"

#endif  // KCENON_CLOUD_BACKUP_CLOUD_BACKUP_H
