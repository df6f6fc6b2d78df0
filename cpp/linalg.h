/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is RateStrap.
 * The Initial Developer of the Original Software is REDUKTI LIMITED (http://redukti.com).
 *
 * Copyright 2017-2019 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 3 (https://www.gnu.org/licenses/gpl.txt).
 */

#ifndef _RATESTRAP_LINALG_H
#define _RATESTRAP_LINALG_H

#if !defined(USE_OPENBLAS)

// using reference BLAS and LAPACK

#ifdef __cplusplus
extern "C" {
#endif

extern void dgemm_(char *transa, char *transb, int *m, int *n, int *k, double *alpha, double *a, int *lda, double *b,
		   int *ldb, double *beta, double *c, int *ldc);
extern void dtrsm_(char *side, char *uplo, char *transa, char *diag, int *m, int *n, double *alpha, double *a, int *lda,
		   double *b, int *ldb);
extern void dgtsv_(int *n, int *nrhs, double *dl, double *d, double *du, double *b, int *ldb, int *info);

#ifdef __cplusplus
}
#endif

#else

#include <cblas.h>

#ifdef __cplusplus
extern "C" {
#endif

extern void dgtsv_(int *n, int *nrhs, double *dl, double *d, double *du, double *b, int *ldb, int *info);

#ifdef __cplusplus
}
#endif

#endif

#endif
