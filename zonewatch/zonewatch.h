#pragma once

// Brings up scanning, zone monitoring and the status LED.
void Zonewatch_Init(void);

// Call from loop(): retries a failed scan start and logs status periodically.
void Zonewatch_Loop(void);
