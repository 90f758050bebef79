#ifndef _VERBOSE_H_
#define _VERBOSE_H_

// when set, progress and diagnostic messages are not written to stderr
extern bool SILENT;
inline void SetSilent(bool s) { SILENT = s; }

#endif
