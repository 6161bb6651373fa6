#pragma once

#include "Dataset.h"
#include <ostream>
#include <string>

namespace CSVUtils {
// CSV export of a dataset. Header is the first record's keys.
// Missing cells are written as empty fields.

std::string escapeField(const std::string& value, char delimiter);
void writeDataset(std::ostream& os, const Dataset& data, char delimiter = ',');

/**
 * @throws Tabula::IOException when the file cannot be opened or written.
 */
void saveDataset(const std::string& path, const Dataset& data, char delimiter = ',');
}
