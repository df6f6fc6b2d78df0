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

#ifndef _RATESTRAP_MATRIX_H
#define _RATESTRAP_MATRIX_H

#include <linalg.h>

#include <assert.h>
#include <stdbool.h>
#include <stdint.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

// Note that the matrix data is assumed to be
// column major
typedef struct ratestrap_matrix_t ratestrap_matrix_t;
struct ratestrap_matrix_t {
	int32_t m; /* rows */
	int32_t n; /* columns */
	double *data;
};

static inline double ratestrap_matrix_get(const struct ratestrap_matrix_t *A, int32_t row, int32_t col)
{
	assert(row < A->m && col < A->n);
	int32_t pos = col * A->m + row;
	return A->data[pos];
}

static inline void ratestrap_matrix_set(struct ratestrap_matrix_t *A, int32_t row, int32_t col, double v)
{
	assert(row < A->m && col < A->n);
	int32_t pos = col * A->m + row;
	A->data[pos] = v;
}

// Dump contents of the matrix
extern void ratestrap_matrix_dump_to(const ratestrap_matrix_t *A, const char *desc, FILE *file);

// C=alpha*A*B + beta*C
// Simple wrapper around dgemm
// To perform C=A*B set alpha to 1.0 and beta to 0.0
static inline void ratestrap_matrix_multiply(ratestrap_matrix_t *A, ratestrap_matrix_t *B, ratestrap_matrix_t *C,
					     bool transposeA, bool transposeB, double alpha, double beta)
{
	int m = transposeA ? A->n : A->m; /* If transposing then m = columns(A) else rows(A) */
	int n = transposeB ? B->m : B->n; /* If transposing then n = rows(B) else columns(B) */
	int k = transposeA ? A->m : A->n; /* If transposing A then k = rows(A) else columns(A) */
	assert(C->m == m);
	assert(C->n == n);
	int lda = A->m;
	int ldb = B->m;
	int ldc = C->m;
#if defined(USE_OPENBLAS)
	cblas_dgemm(CblasColMajor, transposeA ? CblasTrans : CblasNoTrans, transposeB ? CblasTrans : CblasNoTrans, m, n,
		    k, alpha, A->data, lda, B->data, ldb, beta, C->data, ldc);
#else
	char transa = transposeA ? 'T' : 'N';
	char transb = transposeB ? 'T' : 'N';
	dgemm_(&transa, &transb, &m, &n, &k, &alpha, A->data, &lda, B->data, &ldb, &beta, C->data, &ldc);
#endif
}

// Solves L*X = B in place where L is the lower triangle of
// the square matrix L; B is overwritten with X.
// If unit_diagonal is set the diagonal of L is taken to be 1
// and is not referenced.
static inline void ratestrap_matrix_lower_solve(ratestrap_matrix_t *L, ratestrap_matrix_t *B, bool unit_diagonal)
{
	assert(L->m == L->n);
	assert(B->m == L->m);
	int m = B->m;
	int n = B->n;
	int lda = L->m > 1 ? L->m : 1;
	int ldb = B->m > 1 ? B->m : 1;
	double alpha = 1.0;
#if defined(USE_OPENBLAS)
	cblas_dtrsm(CblasColMajor, CblasLeft, CblasLower, CblasNoTrans, unit_diagonal ? CblasUnit : CblasNonUnit, m, n,
		    alpha, L->data, lda, B->data, ldb);
#else
	char side = 'L';
	char uplo = 'L';
	char transa = 'N';
	char diag = unit_diagonal ? 'U' : 'N';
	dtrsm_(&side, &uplo, &transa, &diag, &m, &n, &alpha, L->data, &lda, B->data, &ldb);
#endif
}

// Solves a tridiagonal system of size n with sub diagonal dl (n-1),
// diagonal d (n) and super diagonal du (n-1). The three diagonals
// are overwritten; b holds the right hand side on entry and the
// solution on exit. Returns 0 on success, > 0 if the system is
// singular
static inline int ratestrap_tridiagonal_solve(int n, double *dl, double *d, double *du, double *b)
{
	int nrhs = 1;
	int ldb = n > 1 ? n : 1;
	int info = 0;
	dgtsv_(&n, &nrhs, dl, d, du, b, &ldb, &info);
	return info;
}

#ifdef __cplusplus
}
#endif

#endif
