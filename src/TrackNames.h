#pragma once

#include "Track.h"

const char* PayloadKindName(PayloadKind k);
const char* ClassificationName(Classification c);
const char* ClassificationShortName(Classification c);
const char* MovementTrendName(MovementTrend t);
const char* BatteryTierName(BatteryTier b);
const char* ScanModeName(ScanMode m);

bool ParseScanMode(const char* s, ScanMode& out);
bool ParseClassification(const char* s, Classification& out);
